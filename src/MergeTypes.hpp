#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

// Unit a skip count is measured in.
enum class SkipUnit {
    Lines,
    Bytes
};

// Which end of a file a skip directive trims.
enum class SkipEnd {
    Head,
    Tail
};

// A trim request. "Once" variants are suppressed for the first file (head)
// or the last file (tail) of a run.
struct Skip {
    SkipUnit unit = SkipUnit::Lines;
    bool once = false;
    uint64_t count = 0;

    static Skip Lines(uint64_t n) { return Skip{SkipUnit::Lines, false, n}; }
    static Skip LinesOnce(uint64_t n) { return Skip{SkipUnit::Lines, true, n}; }
    static Skip Bytes(uint64_t n) { return Skip{SkipUnit::Bytes, false, n}; }
    static Skip BytesOnce(uint64_t n) { return Skip{SkipUnit::Bytes, true, n}; }
};

// Padding around files. Each slot is an independent emission; the named
// constructors fill exactly one of them.
struct Pad {
    std::optional<std::string> before;
    std::optional<std::string> between;
    std::optional<std::string> after;

    static Pad Before(const std::string& bytes) { return Pad{bytes, std::nullopt, std::nullopt}; }
    static Pad After(const std::string& bytes) { return Pad{std::nullopt, std::nullopt, bytes}; }
    static Pad Between(const std::string& bytes) { return Pad{std::nullopt, bytes, std::nullopt}; }
    static Pad Custom(std::optional<std::string> before,
                      std::optional<std::string> between,
                      std::optional<std::string> after) {
        return Pad{std::move(before), std::move(between), std::move(after)};
    }

    bool empty() const { return !before && !between && !after; }
};

enum class Newline {
    Lf,
    Crlf
};

inline const char* newlineBytes(Newline nl) {
    return nl == Newline::Crlf ? "\r\n" : "\n";
}

// [start, end) into one file's bytes; 0 <= start <= end <= length.
struct TrimRange {
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t size() const { return end - start; }
    bool empty() const { return start == end; }
};

// One input file's position in the run.
struct FileSlot {
    std::string path;
    size_t index = 0;
    bool isFirst = false;
    bool isLast = false;

    static FileSlot at(const std::string& path, size_t index, size_t count) {
        return FileSlot{path, index, index == 0, index + 1 == count};
    }
};
