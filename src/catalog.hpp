// SPDX-License-Identifier: MIT

// src/catalog.hpp
#pragma once

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "lib/stream/error.hpp"

namespace stream_sync {

/// A stream requested by the caller.
struct ConfiguredStream {
    std::string name;
    std::optional<std::string> stream_namespace;
};

/// Ordered list of requested streams; streams are read in this order.
struct ConfiguredCatalog {
    std::vector<ConfiguredStream> streams;
};

/// Prior state: stream name -> raw JSON stream state.
using StateMap = std::map<std::string, std::string>;

/// Parse `{"streams":[{"stream":{"name":"..","namespace":".."}}, ...]}`.
std::expected<ConfiguredCatalog, Error> ParseConfiguredCatalog(std::string_view json);

/// Parse either a per-stream state list
/// `[{"type":"STREAM","stream":{"stream_descriptor":{"name":".."},"stream_state":{..}}}]`
/// or a legacy object `{"<stream>": {..}}`. An empty document yields an empty map.
std::expected<StateMap, Error> ParseStreamState(std::string_view json);

}  // namespace stream_sync
