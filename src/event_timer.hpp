// SPDX-License-Identifier: MIT

// src/event_timer.hpp
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace stream_sync {

/// Tracks named events (one per stream) and renders a duration summary.
///
/// Pure bookkeeping: starting an already started event, finishing an
/// unknown or finished one, and reporting never fail.
///
/// Report format:
/// @code
/// <name> runtimes:
/// users    0.12
/// orders   3.40
/// @endcode
/// Events are listed by id; ids are padded to the longest id plus two.
/// Events still running report the time elapsed so far.
class EventTimer {
public:
    using Clock = std::chrono::steady_clock;

    explicit EventTimer(std::string name) : name_(std::move(name)) {}

    void StartEvent(const std::string& id);
    void FinishEvent(const std::string& id);

    bool IsRunning(const std::string& id) const;

    /// Elapsed time of an event (so far, if still running).
    std::optional<Clock::duration> Duration(const std::string& id) const;

    /// Every event's duration in seconds, ordered by id.
    std::map<std::string, double> DurationsSeconds() const;

    std::string Report() const;

    const std::string& name() const { return name_; }

private:
    struct Event {
        Clock::time_point start;
        std::optional<Clock::time_point> end;
    };

    std::string name_;
    std::map<std::string, Event> events_;
};

}  // namespace stream_sync
