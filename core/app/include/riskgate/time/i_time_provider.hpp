#pragma once

#include <cstdint>

namespace riskgate {

// -----------------------------------------------------------------------------
// ITimeProvider — source of "now" for the service layer
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the clock so that requests without an explicit `now_ms`
//         can be stamped deterministically in tests and replays.
//
// @details
// The decision core never reads a clock: every timestamp it uses arrives in
// a snapshot or as an explicit argument. Only RiskService consults an
// ITimeProvider, and only to fill in a missing `now_ms` on a request.
//
//   - LiveTimeProvider       → std::chrono::system_clock.
//   - SimulationTimeProvider → value set by the test or replay harness.
//
// Implementations must tolerate concurrent reads.
//
// Ownership:
//   Borrowed by const reference; the provider must outlive its users.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // @brief  Milliseconds since the Unix epoch (UTC).
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace riskgate
