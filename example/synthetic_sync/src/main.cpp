// SPDX-License-Identifier: MIT

// example/synthetic_sync/src/main.cpp
// Synthetic concurrent source: builds generated streams, syncs them and
// writes one JSON message per line to stdout. Logs go to stderr.

#include <cstdlib>
#include <exception>
#include <expected>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "src/catalog.hpp"
#include "src/concurrent_source.hpp"
#include "src/message_writer.hpp"
#include "src/sync_config.hpp"
#include "synthetic_sync/synthetic_stream.hpp"

namespace {

struct Options {
    std::string config_path;
    std::string catalog_path;
    std::string state_path;
    std::size_t streams = 3;
    std::size_t partitions = 2;
    std::size_t records = 10;
    std::string fail_stream;
};

bool ParseArgs(int argc, char** argv, Options& opts) {
    argparse::ArgumentParser program("synthetic_sync");
    program.add_description("Sync generated streams and write JSON lines to stdout.");
    program.add_argument("--config").help("sync config JSON file").default_value(std::string(""));
    program.add_argument("--catalog").help("configured catalog JSON file").default_value(std::string(""));
    program.add_argument("--state").help("prior stream state JSON file").default_value(std::string(""));
    program.add_argument("--streams").scan<'u', std::size_t>().default_value(opts.streams);
    program.add_argument("--partitions").scan<'u', std::size_t>().default_value(opts.partitions);
    program.add_argument("--records")
        .help("records per partition")
        .scan<'u', std::size_t>()
        .default_value(opts.records);
    program.add_argument("--fail-stream")
        .help("stream whose last partition fails")
        .default_value(std::string(""));

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << ex.what() << "\n";
        std::cerr << program;
        return false;
    }

    opts.config_path = program.get<std::string>("--config");
    opts.catalog_path = program.get<std::string>("--catalog");
    opts.state_path = program.get<std::string>("--state");
    opts.streams = program.get<std::size_t>("--streams");
    opts.partitions = program.get<std::size_t>("--partitions");
    opts.records = program.get<std::size_t>("--records");
    opts.fail_stream = program.get<std::string>("--fail-stream");
    return true;
}

std::expected<std::string, stream_sync::Error> ReadOptional(const std::string& path,
                                                            std::string fallback) {
    if (path.empty()) return fallback;
    return stream_sync::ReadTextFile(path);
}

}  // namespace

int main(int argc, char** argv) {
    Options opts;
    if (!ParseArgs(argc, argv, opts)) {
        return 2;
    }

    auto logger = spdlog::stderr_color_mt("synthetic_sync");
    spdlog::set_default_logger(logger);

    auto fail = [&](const stream_sync::Error& error) {
        logger->error("{} ({}): {}", stream_sync::error_code_name(error.code),
                      stream_sync::error_category(error.code), error.message);
        return 1;
    };

    auto config_json = ReadOptional(opts.config_path, "{}");
    if (!config_json) return fail(config_json.error());
    auto config = stream_sync::ParseSyncConfig(*config_json);
    if (!config) return fail(config.error());

    std::vector<std::string> names;
    for (std::size_t i = 0; i < opts.streams; ++i) {
        names.push_back("stream_" + std::to_string(i));
    }

    stream_sync::ConfiguredCatalog catalog;
    if (opts.catalog_path.empty()) {
        for (const auto& name : names) {
            catalog.streams.push_back({.name = name, .stream_namespace = std::nullopt});
        }
    } else {
        auto catalog_json = stream_sync::ReadTextFile(opts.catalog_path);
        if (!catalog_json) return fail(catalog_json.error());
        auto parsed = stream_sync::ParseConfiguredCatalog(*catalog_json);
        if (!parsed) return fail(parsed.error());
        catalog = std::move(*parsed);
    }

    auto state_json = ReadOptional(opts.state_path, "");
    if (!state_json) return fail(state_json.error());
    auto state = stream_sync::ParseStreamState(*state_json);
    if (!state) return fail(state.error());

    auto repository = std::make_shared<stream_sync::InMemoryMessageRepository>();
    auto factory = [&]() -> std::expected<std::vector<std::shared_ptr<stream_sync::Stream>>,
                                          stream_sync::Error> {
        std::vector<std::shared_ptr<stream_sync::Stream>> streams;
        for (const auto& name : names) {
            synthetic_sync::SyntheticStream::Options stream_opts{
                .partitions = opts.partitions,
                .records_per_partition = opts.records,
                .fail = name == opts.fail_stream,
            };
            streams.push_back(std::make_shared<synthetic_sync::SyntheticStream>(
                name, stream_opts, *repository));
        }
        return streams;
    };

    stream_sync::ConcurrentSource source("synthetic_sync", *config, factory, repository, logger);
    stream_sync::JsonLinesSink sink(std::cout);
    auto summary = source.Read(catalog, *state, sink);
    std::cout.flush();
    if (!summary) return fail(summary.error());

    logger->info("Wrote {} messages, {} records", sink.written(), summary->total_records);
    return 0;
}
