// SPDX-License-Identifier: MIT

// src/cursor.cpp
#include "src/cursor.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "src/message_repository.hpp"

namespace stream_sync {

WatermarkCursor::WatermarkCursor(std::string stream_name,
                                 std::optional<std::string> stream_namespace,
                                 std::string cursor_field,
                                 ValueExtractor extract,
                                 MessageRepository& repository)
    : stream_name_(std::move(stream_name)),
      stream_namespace_(std::move(stream_namespace)),
      cursor_field_(std::move(cursor_field)),
      extract_(std::move(extract)),
      repository_(repository) {}

void WatermarkCursor::Observe(const Record& record) {
    std::optional<CursorValue> value = extract_(record);
    if (!value) return;
    if (!watermark_ || *value > *watermark_) {
        watermark_ = std::move(value);
    }
}

void WatermarkCursor::ClosePartition(const Partition& /*partition*/) {
    if (!watermark_ || watermark_ == checkpointed_) return;
    checkpointed_ = watermark_;
    repository_.Emit(StateMessage{
        .stream = StreamDescriptor{stream_name_, stream_namespace_},
        .state = SerializeState(),
    });
}

std::expected<void, Error> WatermarkCursor::LoadState(std::string_view state_json) {
    rapidjson::Document doc;
    doc.Parse(state_json.data(), state_json.size());
    if (doc.HasParseError()) {
        return std::unexpected(Error{ErrorCode::ParseError,
            "state for stream " + stream_name_ + ": " +
            rapidjson::GetParseError_En(doc.GetParseError())});
    }
    if (!doc.IsObject()) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
            "state for stream " + stream_name_ + " must be a JSON object"});
    }
    auto it = doc.FindMember(cursor_field_.c_str());
    if (it == doc.MemberEnd()) {
        return {};  // no checkpoint yet
    }
    if (it->value.IsString()) {
        watermark_ = std::string(it->value.GetString(), it->value.GetStringLength());
    } else if (it->value.IsInt64()) {
        watermark_ = it->value.GetInt64();
    } else {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
            "state field " + cursor_field_ + " of stream " + stream_name_ +
            " must be a string or an integer"});
    }
    checkpointed_ = watermark_;
    return {};
}

WatermarkCursor::ValueExtractor WatermarkCursor::JsonField(std::string field) {
    return [field = std::move(field)](const Record& record) -> std::optional<CursorValue> {
        rapidjson::Document doc;
        doc.Parse(record.data.data(), record.data.size());
        if (doc.HasParseError() || !doc.IsObject()) return std::nullopt;
        auto it = doc.FindMember(field.c_str());
        if (it == doc.MemberEnd()) return std::nullopt;
        if (it->value.IsString()) {
            return CursorValue{std::string(it->value.GetString(), it->value.GetStringLength())};
        }
        if (it->value.IsInt64()) {
            return CursorValue{it->value.GetInt64()};
        }
        return std::nullopt;
    };
}

std::string WatermarkCursor::SerializeState() const {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key(cursor_field_.c_str(), static_cast<rapidjson::SizeType>(cursor_field_.size()));
    if (const auto* number = std::get_if<int64_t>(&*watermark_)) {
        writer.Int64(*number);
    } else {
        const auto& text = std::get<std::string>(*watermark_);
        writer.String(text.c_str(), static_cast<rapidjson::SizeType>(text.size()));
    }
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace stream_sync
