// SPDX-License-Identifier: MIT

// src/message_writer.cpp
#include "src/message_writer.hpp"

#include <string_view>
#include <variant>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "lib/stream/overloaded.hpp"

namespace stream_sync {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& w, std::string_view s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

void WriteKey(JsonWriter& w, std::string_view key) {
    w.Key(key.data(), static_cast<rapidjson::SizeType>(key.size()));
}

void WriteRaw(JsonWriter& w, std::string_view json) {
    w.RawValue(json.data(), json.size(), rapidjson::kObjectType);
}

void WriteDescriptor(JsonWriter& w, const StreamDescriptor& stream) {
    w.StartObject();
    WriteKey(w, "name");
    WriteString(w, stream.name);
    if (stream.stream_namespace) {
        WriteKey(w, "namespace");
        WriteString(w, *stream.stream_namespace);
    }
    w.EndObject();
}

void WriteRecord(JsonWriter& w, const RecordMessage& m) {
    WriteKey(w, "type");
    WriteString(w, "RECORD");
    WriteKey(w, "record");
    w.StartObject();
    WriteKey(w, "stream");
    WriteString(w, m.stream.name);
    if (m.stream.stream_namespace) {
        WriteKey(w, "namespace");
        WriteString(w, *m.stream.stream_namespace);
    }
    WriteKey(w, "data");
    WriteRaw(w, m.data);
    WriteKey(w, "emitted_at");
    w.Int64(m.emitted_at);
    w.EndObject();
}

void WriteStatus(JsonWriter& w, const StreamStatusMessage& m) {
    WriteKey(w, "type");
    WriteString(w, "TRACE");
    WriteKey(w, "trace");
    w.StartObject();
    WriteKey(w, "type");
    WriteString(w, "STREAM_STATUS");
    WriteKey(w, "emitted_at");
    w.Int64(m.emitted_at);
    WriteKey(w, "stream_status");
    w.StartObject();
    WriteKey(w, "stream_descriptor");
    WriteDescriptor(w, m.stream);
    WriteKey(w, "status");
    WriteString(w, to_string(m.status));
    w.EndObject();
    w.EndObject();
}

void WriteLog(JsonWriter& w, const LogMessage& m) {
    WriteKey(w, "type");
    WriteString(w, "LOG");
    WriteKey(w, "log");
    w.StartObject();
    WriteKey(w, "level");
    WriteString(w, to_string(m.level));
    WriteKey(w, "message");
    WriteString(w, m.message);
    w.EndObject();
}

void WriteState(JsonWriter& w, const StateMessage& m) {
    WriteKey(w, "type");
    WriteString(w, "STATE");
    WriteKey(w, "state");
    w.StartObject();
    WriteKey(w, "type");
    WriteString(w, "STREAM");
    WriteKey(w, "stream");
    w.StartObject();
    WriteKey(w, "stream_descriptor");
    WriteDescriptor(w, m.stream);
    WriteKey(w, "stream_state");
    WriteRaw(w, m.state);
    w.EndObject();
    w.EndObject();
}

}  // namespace

std::string SerializeMessage(const OutputMessage& message) {
    rapidjson::StringBuffer buffer;
    JsonWriter writer(buffer);
    writer.StartObject();
    std::visit(Overloaded{
        [&](const RecordMessage& m) { WriteRecord(writer, m); },
        [&](const StreamStatusMessage& m) { WriteStatus(writer, m); },
        [&](const LogMessage& m) { WriteLog(writer, m); },
        [&](const StateMessage& m) { WriteState(writer, m); },
    }, message);
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace stream_sync
