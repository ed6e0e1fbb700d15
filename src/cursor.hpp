// SPDX-License-Identifier: MIT

// src/cursor.hpp
#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "lib/stream/error.hpp"
#include "src/partition.hpp"
#include "src/record.hpp"

namespace stream_sync {

class MessageRepository;

/// Per-stream progress tracker.
///
/// Observe() and ClosePartition() are called from the driver thread only,
/// never concurrently. LoadState() is called once before the run starts.
class Cursor {
public:
    virtual ~Cursor() = default;

    /// Update the progress watermark with a freshly read record.
    virtual void Observe(const Record& record) = 0;

    /// Finalize bookkeeping for a partition whose records were all read.
    virtual void ClosePartition(const Partition& partition) = 0;

    /// Seed the cursor from prior state (raw JSON stream state).
    virtual std::expected<void, Error> LoadState(std::string_view state_json) {
        (void)state_json;
        return {};
    }
};

/// Cursor for full-refresh streams: tracks nothing.
class NoopCursor : public Cursor {
public:
    void Observe(const Record&) override {}
    void ClosePartition(const Partition&) override {}
};

/// Cursor field value: an integer or a string.
///
/// Integers compare numerically and strings lexicographically (which orders
/// ISO-8601 timestamps). Any integer orders before any string.
using CursorValue = std::variant<int64_t, std::string>;

/// Cursor that tracks the greatest cursor-field value seen and checkpoints it.
///
/// When a partition closes and the watermark moved since the last
/// checkpoint, a StateMessage `{"<field>": <value>}` is emitted through the
/// message repository. The value keeps its JSON type.
class WatermarkCursor : public Cursor {
public:
    /// Extracts the cursor value from a record, or nullopt if it has none.
    using ValueExtractor = std::function<std::optional<CursorValue>(const Record&)>;

    WatermarkCursor(std::string stream_name,
                    std::optional<std::string> stream_namespace,
                    std::string cursor_field,
                    ValueExtractor extract,
                    MessageRepository& repository);

    void Observe(const Record& record) override;
    void ClosePartition(const Partition& partition) override;
    std::expected<void, Error> LoadState(std::string_view state_json) override;

    const std::optional<CursorValue>& watermark() const { return watermark_; }
    const std::string& cursor_field() const { return cursor_field_; }

    /// Extractor reading a top-level string or integer field of a JSON record.
    static ValueExtractor JsonField(std::string field);

private:
    std::string SerializeState() const;

    std::string stream_name_;
    std::optional<std::string> stream_namespace_;
    std::string cursor_field_;
    ValueExtractor extract_;
    MessageRepository& repository_;

    std::optional<CursorValue> watermark_;
    std::optional<CursorValue> checkpointed_;
};

}  // namespace stream_sync
