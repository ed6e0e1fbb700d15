// SPDX-License-Identifier: MIT

// src/concurrent_source.cpp
#include "src/concurrent_source.hpp"

#include <unordered_map>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace stream_sync {

ConcurrentSource::ConcurrentSource(std::string name,
                                   SyncConfig config,
                                   StreamFactory streams,
                                   std::shared_ptr<MessageRepository> repository,
                                   std::shared_ptr<spdlog::logger> logger)
    : name_(std::move(name)),
      config_(std::move(config)),
      streams_(std::move(streams)),
      repository_(repository ? std::move(repository)
                             : std::make_shared<InMemoryMessageRepository>()),
      logger_(logger ? std::move(logger) : spdlog::default_logger()) {}

std::expected<SyncSummary, Error> ConcurrentSource::Read(const ConfiguredCatalog& catalog,
                                                         const StateMap& state,
                                                         MessageSink& sink) {
    logger_->info("Starting syncing {}", name_);

    if (auto valid = ValidateSyncConfig(config_); !valid) {
        return std::unexpected(valid.error());
    }

    auto eligible = ResolveStreams(catalog, state);
    if (!eligible) {
        logger_->error("Sync {} failed before reading: {}", name_, eligible.error().message);
        return std::unexpected(eligible.error());
    }

    SyncDriver driver(config_, std::move(*eligible), *repository_, logger_, name_);
    auto result = driver.Run(sink);
    if (result) {
        logger_->info("Finished syncing {}", name_);
    }
    return result;
}

std::expected<std::vector<std::shared_ptr<Stream>>, Error> ConcurrentSource::ResolveStreams(
    const ConfiguredCatalog& catalog, const StateMap& state) {
    auto available = streams_();
    if (!available) return std::unexpected(available.error());

    std::unordered_map<std::string, std::shared_ptr<Stream>> by_name;
    for (auto& stream : *available) {
        by_name.emplace(stream->name(), stream);
    }

    std::vector<std::shared_ptr<Stream>> eligible;
    std::unordered_set<std::string> seen;
    for (const ConfiguredStream& configured : catalog.streams) {
        if (!seen.insert(configured.name).second) {
            logger_->warn("Stream {} is configured more than once; reading it once", configured.name);
            continue;
        }

        auto it = by_name.find(configured.name);
        if (it == by_name.end()) {
            if (!config_.raise_exception_on_missing_stream) {
                logger_->warn("Skipped syncing stream '{}' because it no longer exists", configured.name);
                continue;
            }
            return std::unexpected(Error{ErrorCode::MissingStream,
                "The stream " + configured.name + " no longer exists in the configuration. "
                "Refresh the schema in replication settings and remove this stream from "
                "future sync attempts."});
        }
        const std::shared_ptr<Stream>& stream = it->second;

        StreamAvailability availability = stream->CheckAvailability();
        if (!availability.available) {
            logger_->warn("Skipped syncing stream '{}' because it was unavailable. {}",
                          stream->name(), availability.reason);
            continue;
        }

        if (auto prior = state.find(stream->name()); prior != state.end()) {
            if (auto loaded = stream->cursor().LoadState(prior->second); !loaded) {
                return std::unexpected(loaded.error());
            }
        }
        eligible.push_back(stream);
    }
    return eligible;
}

}  // namespace stream_sync
