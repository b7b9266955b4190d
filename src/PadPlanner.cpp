#include "PadPlanner.hpp"

PadPlanner::PadPlanner(const Pad& pad) : pad_(pad) {
}

std::optional<std::string> PadPlanner::padBefore(const FileSlot& slot) const {
    if (pad_.before && slot.isFirst) {
        return pad_.before;
    }
    return std::nullopt;
}

std::optional<std::string> PadPlanner::padAfter(const FileSlot& slot) const {
    bool between = pad_.between && !slot.isLast;
    bool after = pad_.after && slot.isLast;
    if (!between && !after) return std::nullopt;

    std::string bytes;
    if (between) bytes += *pad_.between;
    if (after) bytes += *pad_.after;
    return bytes;
}
