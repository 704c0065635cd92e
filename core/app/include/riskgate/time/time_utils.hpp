#pragma once

#include <chrono>
#include <cstdint>

namespace riskgate {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock instant used by every snapshot and position in the engine.
// Snapshots arrive from collaborators (persistence, execution client) that
// speak epoch milliseconds, so the helpers below convert in both directions.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between Timestamp and int64_t
//         milliseconds since epoch, and derive the UTC trading day.
//
// @details
// ITimeProvider returns int64_t milliseconds and the JSON wire format carries
// `*_ms` integers, while the domain structs carry a Timestamp. These inline
// helpers bridge the two representations.
//
// Thread-safety: Stateless; safe to call from any thread.
// -----------------------------------------------------------------------------

// @brief  Converts epoch milliseconds to a Timestamp.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

// @brief  Converts a Timestamp to epoch milliseconds (truncating).
inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// -------------------------------------------------------------------------
// trading_day
// -------------------------------------------------------------------------
// @brief  Returns the number of whole UTC days since the epoch for tp.
//
// @details
// The daily-loss circuit breaker latches for "the remainder of the day".
// Two timestamps belong to the same trading day iff trading_day() matches.
// Floor division keeps pre-epoch instants on the correct day.
// -------------------------------------------------------------------------
inline std::int64_t trading_day(Timestamp tp) {
  constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;
  std::int64_t ms = timestamp_to_ms(tp);
  std::int64_t day = ms / kMsPerDay;
  if (ms % kMsPerDay < 0) {
    --day;
  }
  return day;
}

}  // namespace riskgate
