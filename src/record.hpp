// SPDX-License-Identifier: MIT

// src/record.hpp
#pragma once

#include <string>

namespace stream_sync {

/// One payload item produced while reading a partition.
///
/// `data` is opaque to the scheduler (JSON object text by convention).
/// Equality is structural: same owning partition and same data.
struct Record {
    std::string stream_name;     ///< Owning stream
    std::string partition_key;   ///< Key of the partition that produced it
    std::string data;            ///< Opaque payload

    bool operator==(const Record&) const = default;
};

}  // namespace stream_sync
