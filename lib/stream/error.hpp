// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace stream_sync {

/// Error codes for all scheduling, configuration and task operations.
enum class ErrorCode {
    // Configuration
    InvalidConfig,     ///< SyncConfig field out of range or wrongly typed
    ParseError,        ///< Config/catalog/state document is not valid JSON
    IoError,           ///< File could not be read

    // Catalog
    MissingStream,     ///< Configured stream absent from the resolved streams

    // Tasks
    DiscoveryFailed,   ///< Partition generation raised or returned an error
    ReadFailed,        ///< Partition reading raised or returned an error

    // Cursor
    CursorFailed,      ///< Cursor observe/close raised on the driver thread

    // Scheduler
    Stalled,           ///< No queue item arrived within the configured timeout
    InvalidState,      ///< Operation called in the wrong pool/driver state
    Cancelled,         ///< Work dropped because the run was aborted
};

/// Error payload carried through queue items and std::expected returns.
struct Error {
    ErrorCode code;        ///< Classified error code
    std::string message;   ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "config", "task").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::ParseError:
        case ErrorCode::IoError:
            return "config";
        case ErrorCode::MissingStream:
            return "catalog";
        case ErrorCode::DiscoveryFailed:
        case ErrorCode::ReadFailed:
            return "task";
        case ErrorCode::CursorFailed:
            return "cursor";
        case ErrorCode::Stalled:
        case ErrorCode::InvalidState:
        case ErrorCode::Cancelled:
            return "scheduler";
    }
    return "unknown";
}

/// Return the enumerator name of an error code.
constexpr std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::MissingStream: return "MissingStream";
        case ErrorCode::DiscoveryFailed: return "DiscoveryFailed";
        case ErrorCode::ReadFailed: return "ReadFailed";
        case ErrorCode::CursorFailed: return "CursorFailed";
        case ErrorCode::Stalled: return "Stalled";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

}  // namespace stream_sync
