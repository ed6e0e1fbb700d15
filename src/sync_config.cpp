// SPDX-License-Identifier: MIT

// src/sync_config.cpp
#include "src/sync_config.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace stream_sync {

namespace {

// Keeps seconds * 1000 well inside the int64 millisecond range.
constexpr double kMaxTimeoutSeconds = 1e9;

std::unexpected<Error> InvalidField(std::string_view key, std::string_view expected) {
    return std::unexpected(Error{ErrorCode::InvalidConfig,
        "config field " + std::string(key) + " must be " + std::string(expected)});
}

}  // namespace

std::expected<void, Error> ValidateSyncConfig(const SyncConfig& config) {
    if (config.max_workers == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "max_workers must be > 0"});
    }
    if (config.max_concurrent_partition_generators == 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
            "max_concurrent_partition_generators must be > 0"});
    }
    if (config.queue_timeout.count() <= 0) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "queue timeout must be positive"});
    }
    return {};
}

std::expected<SyncConfig, Error> ParseSyncConfig(std::string_view json) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        return std::unexpected(Error{ErrorCode::ParseError,
            std::string("config: ") + rapidjson::GetParseError_En(doc.GetParseError()) +
            " at offset " + std::to_string(doc.GetErrorOffset())});
    }
    if (!doc.IsObject()) {
        return std::unexpected(Error{ErrorCode::InvalidConfig, "config must be a JSON object"});
    }

    SyncConfig config;
    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it) {
        std::string_view key(it->name.GetString(), it->name.GetStringLength());
        const auto& value = it->value;

        if (key == "max_workers") {
            if (!value.IsUint64()) return InvalidField(key, "a non-negative integer");
            config.max_workers = static_cast<std::size_t>(value.GetUint64());
        } else if (key == "max_concurrent_partition_generators") {
            if (!value.IsUint64()) return InvalidField(key, "a non-negative integer");
            config.max_concurrent_partition_generators = static_cast<std::size_t>(value.GetUint64());
        } else if (key == "timeout_seconds") {
            if (!value.IsNumber()) return InvalidField(key, "a number");
            double seconds = value.GetDouble();
            if (!(seconds > 0.0 && seconds <= kMaxTimeoutSeconds)) {
                return InvalidField(key, "a positive number of seconds no larger than 1e9");
            }
            config.queue_timeout = std::chrono::milliseconds(
                static_cast<int64_t>(seconds * 1000.0));
        } else if (key == "queue_capacity") {
            if (!value.IsUint64()) return InvalidField(key, "a non-negative integer");
            config.queue_capacity = static_cast<std::size_t>(value.GetUint64());
        } else if (key == "raise_exception_on_missing_stream") {
            if (!value.IsBool()) return InvalidField(key, "a boolean");
            config.raise_exception_on_missing_stream = value.GetBool();
        } else if (key == "log_slices") {
            if (!value.IsBool()) return InvalidField(key, "a boolean");
            config.log_slices = value.GetBool();
        }
    }

    if (auto valid = ValidateSyncConfig(config); !valid) {
        return std::unexpected(valid.error());
    }
    return config;
}

std::expected<std::string, Error> ReadTextFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error{ErrorCode::IoError,
            "cannot open " + path + ": " + std::strerror(errno)});
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(Error{ErrorCode::IoError, "failed reading " + path});
    }
    return contents.str();
}

}  // namespace stream_sync
