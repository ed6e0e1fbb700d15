// SPDX-License-Identifier: MIT

// src/event_timer.cpp
#include "src/event_timer.hpp"

#include <algorithm>
#include <iterator>

#include <fmt/format.h>

namespace stream_sync {

void EventTimer::StartEvent(const std::string& id) {
    events_.try_emplace(id, Event{Clock::now(), std::nullopt});
}

void EventTimer::FinishEvent(const std::string& id) {
    auto it = events_.find(id);
    if (it == events_.end() || it->second.end) return;
    it->second.end = Clock::now();
}

bool EventTimer::IsRunning(const std::string& id) const {
    auto it = events_.find(id);
    return it != events_.end() && !it->second.end;
}

std::optional<EventTimer::Clock::duration> EventTimer::Duration(const std::string& id) const {
    auto it = events_.find(id);
    if (it == events_.end()) return std::nullopt;
    Clock::time_point end = it->second.end.value_or(Clock::now());
    return end - it->second.start;
}

std::map<std::string, double> EventTimer::DurationsSeconds() const {
    std::map<std::string, double> out;
    for (const auto& [id, event] : events_) {
        Clock::time_point end = event.end.value_or(Clock::now());
        out.emplace(id, std::chrono::duration<double>(end - event.start).count());
    }
    return out;
}

std::string EventTimer::Report() const {
    std::string text = fmt::format("{} runtimes:\n", name_);
    std::size_t width = 0;
    for (const auto& [id, event] : events_) {
        width = std::max(width, id.size());
    }
    width += 2;

    auto out = std::back_inserter(text);
    for (const auto& [id, seconds] : DurationsSeconds()) {
        out = fmt::format_to(out, "{:<{}}{:.2f}\n", id, width, seconds);
    }
    return text;
}

}  // namespace stream_sync
