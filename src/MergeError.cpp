#include "MergeError.hpp"
#include <cerrno>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::IoFailure: return "io_failure";
    case ErrorKind::InsufficientContent: return "insufficient_content";
    case ErrorKind::EmptyInput: return "empty_input";
    case ErrorKind::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

MergeError::MergeError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind), detail_(message) {
    rebuildMessage();
}

MergeError MergeError::io(const std::string& message, std::error_code code) {
    MergeError err(ErrorKind::IoFailure, message);
    err.code_ = code;
    err.rebuildMessage();
    return err;
}

MergeError MergeError::ioFromErrno(const std::string& message) {
    // iostreams do not always leave errno behind
    int e = errno != 0 ? errno : EIO;
    return io(message, std::error_code(e, std::generic_category()));
}

MergeError MergeError::insufficientContent(const FileSlot& slot, SkipEnd end, const Skip& skip, uint64_t length) {
    std::string where = end == SkipEnd::Head ? "head" : "tail";
    std::string detail;
    if (skip.unit == SkipUnit::Bytes) {
        detail = "cannot skip " + std::to_string(skip.count) + " bytes from the " + where +
                 ", file is only " + std::to_string(length) + " bytes long";
    } else {
        detail = "cannot skip " + std::to_string(skip.count) + " lines from the " + where +
                 ", file has fewer lines";
    }
    MergeError err(ErrorKind::InsufficientContent, detail);
    err.end_ = end;
    err.attachFile(slot);
    return err;
}

MergeError MergeError::emptyInput() {
    return MergeError(ErrorKind::EmptyInput, "no input files to merge");
}

MergeError MergeError::invalidConfig(const std::string& message) {
    return MergeError(ErrorKind::InvalidConfig, message);
}

void MergeError::attachFile(const FileSlot& slot) {
    if (path_) return;
    path_ = slot.path;
    index_ = slot.index;
    rebuildMessage();
}

void MergeError::attachOutputPosition(uint64_t pos) {
    if (outputPos_) return;
    outputPos_ = pos;
}

void MergeError::rebuildMessage() {
    message_.clear();
    if (path_) {
        message_ += *path_ + ": ";
    }
    message_ += detail_;
    if (code_) {
        message_ += ": " + code_.message();
    }
}

Json::Value MergeError::toJson() const {
    Json::Value error;
    error["kind"] = errorKindName(kind_);
    error["message"] = message_;
    if (code_) {
        error["code"] = code_.value();
    }
    if (path_) {
        error["path"] = *path_;
    }
    if (index_) {
        error["index"] = (Json::Value::UInt64)*index_;
    }
    if (end_) {
        error["end"] = *end_ == SkipEnd::Head ? "head" : "tail";
    }
    if (outputPos_) {
        error["output_position"] = (Json::Value::UInt64)*outputPos_;
    }
    return error;
}
