#include "MergeOptions.hpp"
#include "MergeError.hpp"

MergeOptions& MergeOptions::skipHead(const Skip& skip) {
    if (head_) {
        throw MergeError::invalidConfig("only one head skip may be configured");
    }
    head_ = skip;
    return *this;
}

MergeOptions& MergeOptions::skipTail(const Skip& skip) {
    if (tail_) {
        throw MergeError::invalidConfig("only one tail skip may be configured");
    }
    tail_ = skip;
    return *this;
}

MergeOptions& MergeOptions::padWith(const Pad& pad) {
    pad_ = pad;
    return *this;
}

MergeOptions& MergeOptions::forceEndingNewline(Newline newline) {
    newline_ = newline;
    return *this;
}
