#pragma once

#include "riskgate/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace riskgate {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is whatever the harness last set.
//
// @details
// Used by the service tests and by replay tooling so that requests without
// `now_ms` are stamped reproducibly (time stops, trading-day boundaries).
// Starts at 0 until advance_time() is called.
//
// Thread model:
//   Single writer, many readers; the value is a std::atomic<int64_t>.
//   Monotonicity is the writer's responsibility.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // @brief  Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // @brief  Moves the clock forward (or back, for negative deltas).
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace riskgate
