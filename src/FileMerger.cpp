#include "FileMerger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include "ByteSeeker.hpp"
#include "MergeError.hpp"

FileMerger::FileMerger(const MergeOptions& options)
    : options_(options), resolver_(options), planner_(options.pad()), buffer_(ByteSeeker::kDefaultChunkSize) {
}

MergeResult FileMerger::write(const std::vector<std::string>& paths, std::ostream& sink, ProgressCallback progress) {
    if (paths.empty()) {
        throw MergeError::emptyInput();
    }
    MergeResult result;
    for (size_t i = 0; i < paths.size(); ++i) {
        FileSlot slot = FileSlot::at(paths[i], i, paths.size());
        errno = 0;
        std::ifstream in(paths[i], std::ios::binary);
        if (!in.is_open()) {
            MergeError err = MergeError::ioFromErrno("cannot open input file");
            err.attachFile(slot);
            err.attachOutputPosition(result.bytesWritten);
            throw err;
        }
        result.bytesWritten += writeSlot(in, slot, sink, result.bytesWritten);
        ++result.filesMerged;
        reportProgress(progress, slot, result, paths.size());
    }
    return result;
}

MergeResult FileMerger::writeStreams(const std::vector<std::istream*>& streams, std::ostream& sink, ProgressCallback progress) {
    if (streams.empty()) {
        throw MergeError::emptyInput();
    }
    MergeResult result;
    for (size_t i = 0; i < streams.size(); ++i) {
        FileSlot slot = FileSlot::at("<stream " + std::to_string(i) + ">", i, streams.size());
        if (streams[i] == nullptr) {
            MergeError err = MergeError::io("input stream is null", std::make_error_code(std::errc::bad_file_descriptor));
            err.attachFile(slot);
            throw err;
        }
        result.bytesWritten += writeSlot(*streams[i], slot, sink, result.bytesWritten);
        ++result.filesMerged;
        reportProgress(progress, slot, result, streams.size());
    }
    return result;
}

uint64_t FileMerger::writeSlot(std::istream& in, const FileSlot& slot, std::ostream& sink, uint64_t outputPos) {
    uint64_t written = 0;
    try {
        auto before = planner_.padBefore(slot);
        if (before) {
            written += emit(sink, before->data(), before->size(), outputPos + written);
        }

        ByteSeeker seeker(in);
        TrimRange range = resolver_.resolve(seeker, slot);

        char lastByte = 0;
        uint64_t copied = 0;
        bool untouched = range.start == 0 && range.end == seeker.length();
        if (untouched && !options_.newline()) {
            copied = copyRaw(in, sink, outputPos + written, lastByte);
        } else {
            copied = copyRange(in, range, sink, outputPos + written, lastByte);
        }
        written += copied;

        // Both terminators end in '\n'.
        if (options_.newline() && (copied == 0 || lastByte != '\n')) {
            const char* nl = newlineBytes(*options_.newline());
            written += emit(sink, nl, std::strlen(nl), outputPos + written);
        }

        auto after = planner_.padAfter(slot);
        if (after) {
            written += emit(sink, after->data(), after->size(), outputPos + written);
        }
    } catch (MergeError& e) {
        e.attachFile(slot);
        e.attachOutputPosition(outputPos + written);
        throw;
    }
    return written;
}

uint64_t FileMerger::copyRaw(std::istream& in, std::ostream& sink, uint64_t outputPos, char& lastByte) {
    errno = 0;
    in.clear();
    in.seekg(0, std::ios::beg);
    if (!in) {
        throw MergeError::ioFromErrno("cannot rewind input");
    }
    uint64_t copied = 0;
    for (;;) {
        in.read(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
        size_t got = static_cast<size_t>(in.gcount());
        if (in.bad()) {
            throw MergeError::ioFromErrno("read failed");
        }
        if (got == 0) break;
        copied += emit(sink, buffer_.data(), got, outputPos + copied);
        lastByte = buffer_[got - 1];
        if (got < buffer_.size()) break;
    }
    return copied;
}

uint64_t FileMerger::copyRange(std::istream& in, const TrimRange& range, std::ostream& sink, uint64_t outputPos, char& lastByte) {
    if (range.empty()) return 0;
    errno = 0;
    in.clear();
    in.seekg(static_cast<std::streamoff>(range.start), std::ios::beg);
    if (!in) {
        throw MergeError::ioFromErrno("seek to offset " + std::to_string(range.start) + " failed");
    }
    uint64_t remaining = range.size();
    uint64_t copied = 0;
    while (remaining > 0) {
        size_t n = static_cast<size_t>(std::min<uint64_t>(buffer_.size(), remaining));
        in.read(buffer_.data(), static_cast<std::streamsize>(n));
        if (static_cast<size_t>(in.gcount()) != n) {
            throw MergeError::ioFromErrno("short read at offset " + std::to_string(range.start + copied));
        }
        copied += emit(sink, buffer_.data(), n, outputPos + copied);
        lastByte = buffer_[n - 1];
        remaining -= n;
    }
    return copied;
}

uint64_t FileMerger::emit(std::ostream& sink, const char* data, size_t len, uint64_t outputPos) {
    if (len == 0) return 0;
    errno = 0;
    sink.write(data, static_cast<std::streamsize>(len));
    if (!sink) {
        MergeError err = MergeError::ioFromErrno("write to output failed");
        err.attachOutputPosition(outputPos);
        throw err;
    }
    return len;
}

void FileMerger::reportProgress(const ProgressCallback& progress, const FileSlot& slot, const MergeResult& result, size_t total) const {
    if (!progress) return;
    Json::Value p;
    p["files_done"] = (Json::Value::UInt64)result.filesMerged;
    p["files_total"] = (Json::Value::UInt64)total;
    p["bytes_written"] = (Json::Value::UInt64)result.bytesWritten;
    p["path"] = slot.path;
    p["progress"] = (double)result.filesMerged / (double)total;
    progress(p);
}
