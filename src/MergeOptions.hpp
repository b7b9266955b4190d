#pragma once
#include <optional>
#include "MergeTypes.hpp"

// Resolved configuration for one run: at most one head skip, one tail skip,
// one padding setting and an optional forced ending newline.
class MergeOptions {
public:
    // Each end accepts a single directive. Setting a second one (e.g. plain
    // and once variants together) is rejected with InvalidConfig.
    MergeOptions& skipHead(const Skip& skip);
    MergeOptions& skipTail(const Skip& skip);
    MergeOptions& padWith(const Pad& pad);
    MergeOptions& forceEndingNewline(Newline newline);

    const std::optional<Skip>& headSkip() const { return head_; }
    const std::optional<Skip>& tailSkip() const { return tail_; }
    const Pad& pad() const { return pad_; }
    const std::optional<Newline>& newline() const { return newline_; }

private:
    std::optional<Skip> head_;
    std::optional<Skip> tail_;
    Pad pad_;
    std::optional<Newline> newline_;
};
