#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <vector>

// Finds delimiter bytes in a seekable stream without loading it into memory.
//
// Two independent walks share the one stream: the forward walk starts at
// offset 0 and only moves toward the end, the backward walk starts at the
// last byte and only moves toward the head. Each walk reads fixed-size
// chunks, so memory use does not depend on the stream length.
//
// Not-found is reported through the bool return; stream failures throw
// MergeError (IoFailure).
class ByteSeeker {
public:
    static constexpr size_t kDefaultChunkSize = 4096;

    // Measures the stream length (seek to end, then back to start).
    explicit ByteSeeker(std::istream& stream, size_t chunkSize = kDefaultChunkSize);

    // Next occurrence of `delim` after the previous forward match.
    bool seek(char delim, uint64_t& offset);
    // Previous occurrence of `delim` before the previous backward match.
    // The offset is measured from the start of the stream.
    bool seekBack(char delim, uint64_t& offset);

    // Repeats seek()/seekBack() n times. Fails as soon as one call fails;
    // `offset` is only written on success.
    bool seekNth(char delim, size_t n, uint64_t& offset);
    bool seekNthBack(char delim, size_t n, uint64_t& offset);

    // Rewinds both walks. The length is not measured again.
    void reset();

    // Last byte of the stream, cursors untouched. False for an empty stream.
    bool lastByte(char& byte);

    uint64_t length() const { return length_; }
    bool forwardExhausted() const { return forwardExhausted_; }
    bool backwardExhausted() const { return backwardExhausted_; }

private:
    void readAt(uint64_t pos, char* dst, size_t len);

    std::istream& stream_;
    std::vector<char> buffer_;
    uint64_t length_ = 0;
    uint64_t forwardPos_ = 0;
    uint64_t backwardPos_ = 0;
    bool forwardExhausted_ = false;
    bool backwardExhausted_ = false;
};
