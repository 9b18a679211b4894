#pragma once

// PMX Expected Type
//
// Exposes tl::expected in the pmx namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   pmx::Result<Market> market = fetch_market(slug);
//   if (market.has_value()) {
//       show(*market);
//   } else {
//       return pmx::present(market.error(), std::cerr);
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain the next stage on success
//   result.map(f)       - transform value
//   result.map_error(f) - transform error (used by pmx::promote at stage boundaries)

#include <tl/expected.hpp>

namespace pmx {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace pmx
