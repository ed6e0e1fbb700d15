// SPDX-License-Identifier: MIT

// src/slice_logger.hpp
#pragma once

#include <spdlog/logger.h>

#include "src/message.hpp"
#include "src/partition.hpp"

namespace stream_sync {

/// Decides whether slice log messages go through the message repository
/// and builds them.
class SliceLogger {
public:
    static constexpr std::string_view kSliceLogPrefix = "slice:";

    explicit SliceLogger(bool enabled = false) : enabled_(enabled) {}

    /// Slice messages are emitted when enabled or when @p logger logs at debug level.
    bool ShouldLogSliceMessage(const spdlog::logger& logger) const {
        return enabled_ || logger.should_log(spdlog::level::debug);
    }

    /// `slice:<partition slice json>` at info level.
    LogMessage CreateSliceLogMessage(const Partition& partition) const {
        return LogMessage{LogLevel::Info, std::string(kSliceLogPrefix) + partition.ToSlice()};
    }

private:
    bool enabled_;
};

}  // namespace stream_sync
