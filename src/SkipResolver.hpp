#pragma once
#include <optional>
#include "ByteSeeker.hpp"
#include "MergeOptions.hpp"
#include "MergeTypes.hpp"

// Turns the configured head/tail skips into the byte range of a file that
// survives trimming.
//
// Line counting: every '\n' ends a line, and content after the last '\n'
// (or an empty file) counts as one more, unterminated line. Boundaries are
// always placed right after a '\n', so a '\r' before it stays with its line
// and CRLF lines are never split.
class SkipResolver {
public:
    explicit SkipResolver(const MergeOptions& options);

    // Skips that apply to this slot once the "once" exemptions are taken
    // into account. Zero counts are dropped.
    std::optional<Skip> effectiveHead(const FileSlot& slot) const;
    std::optional<Skip> effectiveTail(const FileSlot& slot) const;

    // Throws MergeError (InsufficientContent) when a skip asks for more
    // than the file holds. Overlapping head and tail skips give an empty
    // range.
    TrimRange resolve(ByteSeeker& seeker, const FileSlot& slot) const;

private:
    uint64_t resolveHead(ByteSeeker& seeker, const Skip& skip, const FileSlot& slot, bool unterminated) const;
    uint64_t resolveTail(ByteSeeker& seeker, const Skip& skip, const FileSlot& slot, bool unterminated) const;

    std::optional<Skip> head_;
    std::optional<Skip> tail_;
};
