#include "ByteSeeker.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include "MergeError.hpp"

ByteSeeker::ByteSeeker(std::istream& stream, size_t chunkSize)
    : stream_(stream) {
    if (chunkSize == 0) {
        throw MergeError::invalidConfig("seek chunk size must be positive");
    }
    buffer_.resize(chunkSize);

    errno = 0;
    stream_.clear();
    stream_.seekg(0, std::ios::end);
    std::streamoff end = stream_.tellg();
    if (!stream_ || end < 0) {
        throw MergeError::ioFromErrno("cannot determine stream length");
    }
    stream_.seekg(0, std::ios::beg);
    if (!stream_) {
        throw MergeError::ioFromErrno("cannot rewind stream");
    }
    length_ = static_cast<uint64_t>(end);
    reset();
}

void ByteSeeker::reset() {
    forwardPos_ = 0;
    backwardPos_ = length_ > 0 ? length_ - 1 : 0;
    forwardExhausted_ = false;
    backwardExhausted_ = false;
}

void ByteSeeker::readAt(uint64_t pos, char* dst, size_t len) {
    errno = 0;
    stream_.clear();
    stream_.seekg(static_cast<std::streamoff>(pos), std::ios::beg);
    if (!stream_) {
        throw MergeError::ioFromErrno("seek to offset " + std::to_string(pos) + " failed");
    }
    stream_.read(dst, static_cast<std::streamsize>(len));
    if (static_cast<size_t>(stream_.gcount()) != len) {
        throw MergeError::ioFromErrno("short read at offset " + std::to_string(pos));
    }
}

bool ByteSeeker::lastByte(char& byte) {
    if (length_ == 0) return false;
    readAt(length_ - 1, &byte, 1);
    return true;
}

bool ByteSeeker::seek(char delim, uint64_t& offset) {
    if (forwardExhausted_) return false;
    if (forwardPos_ >= length_) {
        forwardExhausted_ = true;
        return false;
    }

    // One byte left: compare it directly.
    if (length_ - forwardPos_ == 1) {
        char c = 0;
        readAt(forwardPos_, &c, 1);
        uint64_t pos = forwardPos_;
        forwardPos_ = length_;
        if (c == delim) {
            offset = pos;
            return true;
        }
        forwardExhausted_ = true;
        return false;
    }

    while (forwardPos_ < length_) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), length_ - forwardPos_));
        readAt(forwardPos_, buffer_.data(), n);
        const void* hit = std::memchr(buffer_.data(), static_cast<unsigned char>(delim), n);
        if (hit) {
            offset = forwardPos_ + static_cast<uint64_t>(static_cast<const char*>(hit) - buffer_.data());
            forwardPos_ = offset + 1;
            return true;
        }
        forwardPos_ += n;
    }
    forwardExhausted_ = true;
    return false;
}

bool ByteSeeker::seekBack(char delim, uint64_t& offset) {
    if (backwardExhausted_) return false;
    if (length_ == 0) {
        backwardExhausted_ = true;
        return false;
    }

    // Only the first byte is left; there is no earlier chunk boundary.
    if (backwardPos_ == 0) {
        char c = 0;
        readAt(0, &c, 1);
        backwardExhausted_ = true;
        if (c == delim) {
            offset = 0;
            return true;
        }
        return false;
    }

    for (;;) {
        uint64_t end = backwardPos_ + 1;
        size_t n = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), end));
        uint64_t begin = end - n;
        readAt(begin, buffer_.data(), n);
        for (size_t i = n; i > 0; --i) {
            if (buffer_[i - 1] == delim) {
                offset = begin + (i - 1);
                if (offset == 0) {
                    backwardExhausted_ = true;
                } else {
                    backwardPos_ = offset - 1;
                }
                return true;
            }
        }
        if (begin == 0) {
            backwardExhausted_ = true;
            return false;
        }
        backwardPos_ = begin - 1;
    }
}

bool ByteSeeker::seekNth(char delim, size_t n, uint64_t& offset) {
    if (n == 0) return false;
    uint64_t pos = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!seek(delim, pos)) return false;
    }
    offset = pos;
    return true;
}

bool ByteSeeker::seekNthBack(char delim, size_t n, uint64_t& offset) {
    if (n == 0) return false;
    uint64_t pos = 0;
    for (size_t i = 0; i < n; ++i) {
        if (!seekBack(delim, pos)) return false;
    }
    offset = pos;
    return true;
}
