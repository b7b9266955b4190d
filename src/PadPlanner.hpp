#pragma once
#include <optional>
#include <string>
#include "MergeTypes.hpp"

// Decides which padding surrounds a file, from its position alone.
//  before:  ahead of the first file
//  between: after every file but the last
//  after:   after the last file
class PadPlanner {
public:
    explicit PadPlanner(const Pad& pad);

    std::optional<std::string> padBefore(const FileSlot& slot) const;
    std::optional<std::string> padAfter(const FileSlot& slot) const;

private:
    Pad pad_;
};
