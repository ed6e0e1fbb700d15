// SPDX-License-Identifier: MIT

// synthetic_sync/synthetic_stream.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "src/cursor.hpp"
#include "src/message_repository.hpp"
#include "src/stream.hpp"

namespace synthetic_sync {

/// Partition producing `records` generated rows `{"id":..,"updated_at":..}`.
class SyntheticPartition : public stream_sync::Partition {
public:
    SyntheticPartition(std::string stream_name, std::size_t index,
                       std::size_t records, bool fail)
        : stream_name_(std::move(stream_name)),
          index_(index),
          records_(records),
          fail_(fail) {}

    const std::string& stream_name() const override { return stream_name_; }
    std::string Key() const override { return std::to_string(index_); }

    std::string ToSlice() const override {
        return fmt::format(R"({{"partition":{}}})", index_);
    }

    std::expected<void, stream_sync::Error> Read(const RecordEmitter& emit,
                                                 std::stop_token stop) override {
        for (std::size_t i = 0; i < records_; ++i) {
            if (stop.stop_requested()) return {};
            std::size_t id = index_ * records_ + i;
            if (!emit(fmt::format(R"({{"id":{},"updated_at":{}}})", id, id))) {
                return {};
            }
        }
        if (fail_) {
            return std::unexpected(stream_sync::Error{stream_sync::ErrorCode::ReadFailed,
                "synthetic failure in " + ToString()});
        }
        return {};
    }

private:
    std::string stream_name_;
    std::size_t index_;
    std::size_t records_;
    bool fail_;
};

/// Stream with a fixed number of synthetic partitions and a watermark cursor
/// on `updated_at`.
class SyntheticStream : public stream_sync::Stream {
public:
    struct Options {
        std::size_t partitions = 2;
        std::size_t records_per_partition = 10;
        bool fail = false;   ///< Last partition fails after its records
    };

    SyntheticStream(std::string name, Options options,
                    stream_sync::MessageRepository& repository)
        : name_(std::move(name)),
          options_(options),
          cursor_(name_, std::nullopt, "updated_at",
                  stream_sync::WatermarkCursor::JsonField("updated_at"), repository) {}

    const std::string& name() const override { return name_; }
    const std::optional<std::string>& stream_namespace() const override { return namespace_; }

    std::expected<void, stream_sync::Error> GeneratePartitions(
            const PartitionEmitter& emit, std::stop_token stop) override {
        for (std::size_t i = 0; i < options_.partitions; ++i) {
            if (stop.stop_requested()) return {};
            bool fail = options_.fail && i + 1 == options_.partitions;
            if (!emit(std::make_shared<SyntheticPartition>(
                    name_, i, options_.records_per_partition, fail))) {
                return {};
            }
        }
        return {};
    }

    stream_sync::Cursor& cursor() override { return cursor_; }

private:
    std::string name_;
    std::optional<std::string> namespace_;
    Options options_;
    stream_sync::WatermarkCursor cursor_;
};

}  // namespace synthetic_sync
