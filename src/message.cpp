// SPDX-License-Identifier: MIT

// src/message.cpp
#include "src/message.hpp"

#include <chrono>

namespace stream_sync {

int64_t NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

OutputMessage ToRecordMessage(std::string stream_name,
                              std::optional<std::string> stream_namespace,
                              std::string data) {
    return RecordMessage{
        .stream = StreamDescriptor{std::move(stream_name), std::move(stream_namespace)},
        .data = std::move(data),
        .emitted_at = NowMillis(),
    };
}

OutputMessage ToStatusMessage(std::string stream_name,
                              std::optional<std::string> stream_namespace,
                              StreamStatus status) {
    return StreamStatusMessage{
        .stream = StreamDescriptor{std::move(stream_name), std::move(stream_namespace)},
        .status = status,
        .emitted_at = NowMillis(),
    };
}

}  // namespace stream_sync
