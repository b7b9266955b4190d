#include "MergeConfig.hpp"
#include <fstream>
#include "MergeError.hpp"

namespace {

std::optional<uint64_t> readCount(const Json::Value& root, const char* key) {
    if (!root.isMember(key) || root[key].isNull()) return std::nullopt;
    const Json::Value& v = root[key];
    if (!v.isUInt64()) {
        throw MergeError::invalidConfig(std::string(key) + " must be a non-negative integer");
    }
    return v.asUInt64();
}

std::string readString(const Json::Value& root, const char* key, const std::string& fallback) {
    if (!root.isMember(key)) return fallback;
    if (!root[key].isString()) {
        throw MergeError::invalidConfig(std::string(key) + " must be a string");
    }
    return root[key].asString();
}

}

void MergeConfig::applyJson(const Json::Value& root) {
    if (!root.isObject()) {
        throw MergeError::invalidConfig("config root must be an object");
    }
    if (root.isMember("inputs")) {
        const Json::Value& list = root["inputs"];
        if (!list.isArray()) {
            throw MergeError::invalidConfig("inputs must be an array of paths");
        }
        inputs.clear();
        for (const auto& p : list) {
            if (!p.isString()) {
                throw MergeError::invalidConfig("inputs must be an array of paths");
            }
            inputs.push_back(p.asString());
        }
    }
    output = readString(root, "output", output);
    skipMode = readString(root, "skip_mode", skipMode);
    if (auto n = readCount(root, "skip_head")) skipHead = n;
    if (auto n = readCount(root, "skip_head_once")) skipHeadOnce = n;
    if (auto n = readCount(root, "skip_tail")) skipTail = n;
    if (auto n = readCount(root, "skip_tail_once")) skipTailOnce = n;
    if (root.isMember("padding")) {
        padding = readString(root, "padding", "");
    }
    padMode = readString(root, "pad_mode", padMode);
    if (root.isMember("newline")) {
        if (!root["newline"].isBool()) {
            throw MergeError::invalidConfig("newline must be a boolean");
        }
        newline = root["newline"].asBool();
    }
    newlineStyle = readString(root, "newline_style", newlineStyle);
}

MergeConfig MergeConfig::fromJson(const Json::Value& root) {
    MergeConfig config;
    config.applyJson(root);
    return config;
}

MergeConfig MergeConfig::loadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw MergeError::ioFromErrno("cannot open config file " + path);
    }
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw MergeError::invalidConfig("malformed config file " + path + ": " + errs);
    }
    return fromJson(root);
}

MergeOptions MergeConfig::toOptions() const {
    MergeOptions options;

    bool bytes = false;
    if (skipMode == "bytes") {
        bytes = true;
    } else if (skipMode != "lines") {
        throw MergeError::invalidConfig("unknown skip mode: " + skipMode);
    }
    if (skipHead && skipHeadOnce) {
        throw MergeError::invalidConfig("skip_head and skip_head_once are mutually exclusive");
    }
    if (skipTail && skipTailOnce) {
        throw MergeError::invalidConfig("skip_tail and skip_tail_once are mutually exclusive");
    }
    if (skipHead) options.skipHead(bytes ? Skip::Bytes(*skipHead) : Skip::Lines(*skipHead));
    if (skipHeadOnce) options.skipHead(bytes ? Skip::BytesOnce(*skipHeadOnce) : Skip::LinesOnce(*skipHeadOnce));
    if (skipTail) options.skipTail(bytes ? Skip::Bytes(*skipTail) : Skip::Lines(*skipTail));
    if (skipTailOnce) options.skipTail(bytes ? Skip::BytesOnce(*skipTailOnce) : Skip::LinesOnce(*skipTailOnce));

    if (padMode != "beforestart" && padMode != "afterend" && padMode != "between" && padMode != "all") {
        throw MergeError::invalidConfig("unknown pad mode: " + padMode);
    }
    if (padding) {
        if (padMode == "beforestart") {
            options.padWith(Pad::Before(*padding));
        } else if (padMode == "afterend") {
            options.padWith(Pad::After(*padding));
        } else if (padMode == "between") {
            options.padWith(Pad::Between(*padding));
        } else {
            options.padWith(Pad::Custom(*padding, *padding, *padding));
        }
    }

    if (newlineStyle != "lf" && newlineStyle != "crlf") {
        throw MergeError::invalidConfig("unknown newline style: " + newlineStyle);
    }
    if (newline) {
        options.forceEndingNewline(newlineStyle == "crlf" ? Newline::Crlf : Newline::Lf);
    }
    return options;
}
