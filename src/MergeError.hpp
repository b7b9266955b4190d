#pragma once
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include "MergeTypes.hpp"

enum class ErrorKind {
    IoFailure,
    InsufficientContent,
    EmptyInput,
    InvalidConfig
};

const char* errorKindName(ErrorKind kind);

// The single failure type raised by the merge core. A failure on any file
// aborts the whole run.
class MergeError : public std::runtime_error {
public:
    MergeError(ErrorKind kind, const std::string& message);

    static MergeError io(const std::string& message, std::error_code code);
    static MergeError ioFromErrno(const std::string& message);
    static MergeError insufficientContent(const FileSlot& slot, SkipEnd end, const Skip& skip, uint64_t length);
    static MergeError emptyInput();
    static MergeError invalidConfig(const std::string& message);

    ErrorKind kind() const { return kind_; }
    const std::error_code& code() const { return code_; }
    const std::optional<std::string>& path() const { return path_; }
    const std::optional<size_t>& index() const { return index_; }
    const std::optional<SkipEnd>& end() const { return end_; }
    const std::optional<uint64_t>& outputPosition() const { return outputPos_; }

    // Records which file was being processed when the failure surfaced.
    // Existing file information is kept.
    void attachFile(const FileSlot& slot);
    void attachOutputPosition(uint64_t pos);

    const char* what() const noexcept override { return message_.c_str(); }

    Json::Value toJson() const;

private:
    void rebuildMessage();

    ErrorKind kind_;
    std::string detail_;
    std::string message_;
    std::error_code code_;
    std::optional<std::string> path_;
    std::optional<size_t> index_;
    std::optional<SkipEnd> end_;
    std::optional<uint64_t> outputPos_;
};
