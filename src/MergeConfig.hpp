#pragma once
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "MergeOptions.hpp"

// Unresolved run settings, as read from a JSON config file or the command
// line. toOptions() validates them into a MergeOptions bundle.
struct MergeConfig {
    std::vector<std::string> inputs;
    std::string output;  // empty: standard output

    std::string skipMode = "lines";  // "lines" | "bytes"
    std::optional<uint64_t> skipHead;
    std::optional<uint64_t> skipHeadOnce;
    std::optional<uint64_t> skipTail;
    std::optional<uint64_t> skipTailOnce;

    std::optional<std::string> padding;
    std::string padMode = "between";  // "beforestart" | "afterend" | "between" | "all"

    bool newline = false;
    std::string newlineStyle = "lf";  // "lf" | "crlf"

    // Keys that are absent keep their current value, so a file can be
    // layered over defaults. Throws MergeError (InvalidConfig).
    void applyJson(const Json::Value& root);

    static MergeConfig fromJson(const Json::Value& root);
    static MergeConfig loadFile(const std::string& path);

    MergeOptions toOptions() const;
};
