#include "SkipResolver.hpp"
#include "MergeError.hpp"

SkipResolver::SkipResolver(const MergeOptions& options)
    : head_(options.headSkip()), tail_(options.tailSkip()) {
}

std::optional<Skip> SkipResolver::effectiveHead(const FileSlot& slot) const {
    if (!head_ || head_->count == 0) return std::nullopt;
    if (head_->once && slot.isFirst) return std::nullopt;
    return head_;
}

std::optional<Skip> SkipResolver::effectiveTail(const FileSlot& slot) const {
    if (!tail_ || tail_->count == 0) return std::nullopt;
    if (tail_->once && slot.isLast) return std::nullopt;
    return tail_;
}

TrimRange SkipResolver::resolve(ByteSeeker& seeker, const FileSlot& slot) const {
    TrimRange range{0, seeker.length()};
    auto head = effectiveHead(slot);
    auto tail = effectiveTail(slot);
    if (!head && !tail) return range;

    bool unterminated = true;
    char last = 0;
    if (seeker.lastByte(last)) {
        unterminated = last != '\n';
    }

    if (head) {
        range.start = resolveHead(seeker, *head, slot, unterminated);
    }
    if (tail) {
        range.end = resolveTail(seeker, *tail, slot, unterminated);
    }
    if (range.start > range.end) {
        range.end = range.start;
    }
    return range;
}

uint64_t SkipResolver::resolveHead(ByteSeeker& seeker, const Skip& skip, const FileSlot& slot, bool unterminated) const {
    uint64_t length = seeker.length();
    if (skip.unit == SkipUnit::Bytes) {
        if (skip.count > length) {
            throw MergeError::insufficientContent(slot, SkipEnd::Head, skip, length);
        }
        return skip.count;
    }

    uint64_t offset = 0;
    uint64_t found = 0;
    while (found < skip.count && seeker.seek('\n', offset)) {
        ++found;
    }
    if (found == skip.count) {
        return offset + 1;
    }
    // The last requested line is the unterminated fragment: skip to EOF.
    if (found + 1 == skip.count && unterminated) {
        return length;
    }
    throw MergeError::insufficientContent(slot, SkipEnd::Head, skip, length);
}

uint64_t SkipResolver::resolveTail(ByteSeeker& seeker, const Skip& skip, const FileSlot& slot, bool unterminated) const {
    uint64_t length = seeker.length();
    if (skip.unit == SkipUnit::Bytes) {
        if (skip.count > length) {
            throw MergeError::insufficientContent(slot, SkipEnd::Tail, skip, length);
        }
        return length - skip.count;
    }

    // A terminated last line owns the final '\n', so the cut sits after the
    // next one back.
    uint64_t wanted = unterminated ? skip.count : skip.count + 1;
    uint64_t offset = 0;
    uint64_t found = 0;
    while (found < wanted && seeker.seekBack('\n', offset)) {
        ++found;
    }
    if (found == wanted) {
        return offset + 1;
    }
    // Every line is skipped; the first one has no '\n' before it.
    if (found + 1 == wanted) {
        return 0;
    }
    throw MergeError::insufficientContent(slot, SkipEnd::Tail, skip, length);
}
