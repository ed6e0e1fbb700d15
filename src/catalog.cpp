// SPDX-License-Identifier: MIT

// src/catalog.cpp
#include "src/catalog.hpp"

#include <algorithm>
#include <cctype>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace stream_sync {

namespace {

std::unexpected<Error> Invalid(std::string message) {
    return std::unexpected(Error{ErrorCode::InvalidConfig, std::move(message)});
}

std::expected<rapidjson::Document, Error> ParseDocument(std::string_view json,
                                                        std::string_view what) {
    rapidjson::Document doc;
    doc.Parse(json.data(), json.size());
    if (doc.HasParseError()) {
        return std::unexpected(Error{ErrorCode::ParseError,
            std::string(what) + ": " + rapidjson::GetParseError_En(doc.GetParseError()) +
            " at offset " + std::to_string(doc.GetErrorOffset())});
    }
    return doc;
}

std::string ToJson(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    return std::string(buffer.GetString(), buffer.GetSize());
}

std::optional<std::string> StringMember(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) return std::nullopt;
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

bool IsBlank(std::string_view json) {
    return std::all_of(json.begin(), json.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

}  // namespace

std::expected<ConfiguredCatalog, Error> ParseConfiguredCatalog(std::string_view json) {
    auto doc = ParseDocument(json, "catalog");
    if (!doc) return std::unexpected(doc.error());
    if (!doc->IsObject()) return Invalid("catalog must be a JSON object");

    auto streams = doc->FindMember("streams");
    if (streams == doc->MemberEnd() || !streams->value.IsArray()) {
        return Invalid("catalog.streams must be an array");
    }

    ConfiguredCatalog catalog;
    for (const auto& entry : streams->value.GetArray()) {
        if (!entry.IsObject()) return Invalid("catalog stream entries must be objects");
        auto stream = entry.FindMember("stream");
        if (stream == entry.MemberEnd() || !stream->value.IsObject()) {
            return Invalid("catalog stream entry is missing its stream object");
        }
        auto name = StringMember(stream->value, "name");
        if (!name || name->empty()) return Invalid("catalog stream is missing its name");
        catalog.streams.push_back(ConfiguredStream{
            .name = std::move(*name),
            .stream_namespace = StringMember(stream->value, "namespace"),
        });
    }
    return catalog;
}

std::expected<StateMap, Error> ParseStreamState(std::string_view json) {
    StateMap state;
    if (IsBlank(json)) return state;

    auto doc = ParseDocument(json, "state");
    if (!doc) return std::unexpected(doc.error());

    if (doc->IsObject()) {
        for (auto it = doc->MemberBegin(); it != doc->MemberEnd(); ++it) {
            state.emplace(std::string(it->name.GetString(), it->name.GetStringLength()),
                          ToJson(it->value));
        }
        return state;
    }

    if (!doc->IsArray()) return Invalid("state must be a JSON array or object");

    for (const auto& message : doc->GetArray()) {
        if (!message.IsObject()) return Invalid("state entries must be objects");
        auto type = StringMember(message, "type");
        if (type && *type != "STREAM") continue;  // global/legacy entries are not per-stream

        auto stream = message.FindMember("stream");
        if (stream == message.MemberEnd() || !stream->value.IsObject()) {
            return Invalid("STREAM state entry is missing its stream object");
        }
        auto descriptor = stream->value.FindMember("stream_descriptor");
        if (descriptor == stream->value.MemberEnd() || !descriptor->value.IsObject()) {
            return Invalid("STREAM state entry is missing its stream_descriptor");
        }
        auto name = StringMember(descriptor->value, "name");
        if (!name) return Invalid("stream_descriptor is missing its name");

        auto stream_state = stream->value.FindMember("stream_state");
        if (stream_state == stream->value.MemberEnd() || stream_state->value.IsNull()) {
            continue;
        }
        state.insert_or_assign(std::move(*name), ToJson(stream_state->value));
    }
    return state;
}

}  // namespace stream_sync
