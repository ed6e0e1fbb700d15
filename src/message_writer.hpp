// SPDX-License-Identifier: MIT

// src/message_writer.hpp
#pragma once

#include <ostream>
#include <string>

#include "src/message.hpp"
#include "src/message_sink.hpp"

namespace stream_sync {

/// Serialize one output message as a single-line JSON document.
///
/// Shapes:
/// - `{"type":"RECORD","record":{"stream":..,"namespace":..,"data":{..},"emitted_at":..}}`
/// - `{"type":"TRACE","trace":{"type":"STREAM_STATUS","emitted_at":..,"stream_status":{"stream_descriptor":{..},"status":"RUNNING"}}}`
/// - `{"type":"LOG","log":{"level":"INFO","message":..}}`
/// - `{"type":"STATE","state":{"type":"STREAM","stream":{"stream_descriptor":{..},"stream_state":{..}}}}`
///
/// Record data and stream state are embedded verbatim; they must already be
/// valid JSON. The namespace key is omitted when the stream has none.
std::string SerializeMessage(const OutputMessage& message);

/// Sink writing one JSON line per message to an output stream.
class JsonLinesSink : public MessageSink {
public:
    explicit JsonLinesSink(std::ostream& out) : out_(out) {}

    void OnMessage(OutputMessage&& message) override {
        out_ << SerializeMessage(message) << '\n';
        ++written_;
    }

    std::size_t written() const { return written_; }

private:
    std::ostream& out_;
    std::size_t written_ = 0;
};

}  // namespace stream_sync
