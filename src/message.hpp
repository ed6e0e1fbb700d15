// SPDX-License-Identifier: MIT

// src/message.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace stream_sync {

/// Per-stream lifecycle: STARTED -> RUNNING -> { COMPLETE | INCOMPLETE }.
enum class StreamStatus {
    Started,
    Running,
    Complete,
    Incomplete,
};

constexpr std::string_view to_string(StreamStatus status) {
    switch (status) {
        case StreamStatus::Started: return "STARTED";
        case StreamStatus::Running: return "RUNNING";
        case StreamStatus::Complete: return "COMPLETE";
        case StreamStatus::Incomplete: return "INCOMPLETE";
    }
    return "UNKNOWN";
}

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
};

constexpr std::string_view to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}

struct StreamDescriptor {
    std::string name;
    std::optional<std::string> stream_namespace;

    bool operator==(const StreamDescriptor&) const = default;
};

struct RecordMessage {
    StreamDescriptor stream;
    std::string data;          ///< Raw JSON payload
    int64_t emitted_at = 0;    ///< Milliseconds since the Unix epoch
};

struct StreamStatusMessage {
    StreamDescriptor stream;
    StreamStatus status = StreamStatus::Started;
    int64_t emitted_at = 0;
};

struct LogMessage {
    LogLevel level = LogLevel::Info;
    std::string message;
};

struct StateMessage {
    StreamDescriptor stream;
    std::string state;         ///< Raw JSON stream state
};

/// Everything the scheduler delivers to its output sink.
using OutputMessage = std::variant<RecordMessage, StreamStatusMessage, LogMessage, StateMessage>;

/// Wall-clock milliseconds since the Unix epoch.
int64_t NowMillis();

/// Wrap a raw record payload into an output message.
OutputMessage ToRecordMessage(std::string stream_name,
                              std::optional<std::string> stream_namespace,
                              std::string data);

/// Build the status transition message for a stream.
OutputMessage ToStatusMessage(std::string stream_name,
                              std::optional<std::string> stream_namespace,
                              StreamStatus status);

}  // namespace stream_sync
