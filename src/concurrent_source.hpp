// SPDX-License-Identifier: MIT

// src/concurrent_source.hpp
#pragma once

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "lib/stream/error.hpp"
#include "src/catalog.hpp"
#include "src/message_repository.hpp"
#include "src/message_sink.hpp"
#include "src/stream.hpp"
#include "src/sync_config.hpp"
#include "src/sync_driver.hpp"

namespace stream_sync {

/// A source whose streams are read concurrently.
///
/// Read() resolves the configured catalog against the streams the factory
/// produces, skips unavailable streams, seeds cursors from prior state and
/// hands the eligible streams to a fresh SyncDriver.
///
/// @code
/// ConcurrentSource source("my_source", config, [] { return MakeStreams(); });
/// JsonLinesSink sink(std::cout);
/// auto summary = source.Read(catalog, state, sink);
/// @endcode
class ConcurrentSource {
public:
    using StreamFactory =
        std::function<std::expected<std::vector<std::shared_ptr<Stream>>, Error>()>;

    ConcurrentSource(std::string name,
                     SyncConfig config,
                     StreamFactory streams,
                     std::shared_ptr<MessageRepository> repository = nullptr,
                     std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Sync every configured stream, delivering ordered output to @p sink.
    ///
    /// Errors: InvalidConfig for a bad SyncConfig, MissingStream when a
    /// configured stream is absent and raise_exception_on_missing_stream is
    /// set, errors from LoadState(), and any error aborting the run.
    std::expected<SyncSummary, Error> Read(const ConfiguredCatalog& catalog,
                                           const StateMap& state,
                                           MessageSink& sink);

    const std::string& name() const { return name_; }
    const SyncConfig& config() const { return config_; }

    /// Side channel shared with cursors and streams of this source.
    MessageRepository& message_repository() { return *repository_; }
    std::shared_ptr<MessageRepository> shared_message_repository() const { return repository_; }

private:
    std::expected<std::vector<std::shared_ptr<Stream>>, Error> ResolveStreams(
        const ConfiguredCatalog& catalog, const StateMap& state);

    std::string name_;
    SyncConfig config_;
    StreamFactory streams_;
    std::shared_ptr<MessageRepository> repository_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace stream_sync
