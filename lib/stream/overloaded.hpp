// SPDX-License-Identifier: MIT

// lib/stream/overloaded.hpp
#pragma once

namespace stream_sync {

/// Combine lambdas into one visitor for exhaustive std::visit.
template <typename... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};

}  // namespace stream_sync
