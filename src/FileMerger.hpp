#pragma once
#include <json/json.h>
#include <cstdint>
#include <functional>
#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "MergeOptions.hpp"
#include "PadPlanner.hpp"
#include "SkipResolver.hpp"

struct MergeResult {
    uint64_t bytesWritten = 0;
    size_t filesMerged = 0;
};

class FileMerger {
public:
    // Invoked after every file with
    // { files_done, files_total, bytes_written, path, progress }.
    using ProgressCallback = std::function<void(const Json::Value&)>;

    explicit FileMerger(const MergeOptions& options);

    // Opens, trims and copies the files in order. Each file is opened only
    // when its turn comes and closed before the next one; the first failure
    // aborts the run (bytes already written to `sink` stay there).
    MergeResult write(const std::vector<std::string>& paths, std::ostream& sink, ProgressCallback progress = nullptr);

    // Same as write() for handles the caller already opened.
    MergeResult writeStreams(const std::vector<std::istream*>& streams, std::ostream& sink, ProgressCallback progress = nullptr);

    const MergeOptions& options() const { return options_; }

private:
    uint64_t writeSlot(std::istream& in, const FileSlot& slot, std::ostream& sink, uint64_t outputPos);
    uint64_t copyRange(std::istream& in, const TrimRange& range, std::ostream& sink, uint64_t outputPos, char& lastByte);
    uint64_t copyRaw(std::istream& in, std::ostream& sink, uint64_t outputPos, char& lastByte);
    uint64_t emit(std::ostream& sink, const char* data, size_t len, uint64_t outputPos);
    void reportProgress(const ProgressCallback& progress, const FileSlot& slot, const MergeResult& result, size_t total) const;

    MergeOptions options_;
    SkipResolver resolver_;
    PadPlanner planner_;
    std::vector<char> buffer_;
};
