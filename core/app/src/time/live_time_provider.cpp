#include "riskgate/time/live_time_provider.hpp"
#include "riskgate/time/time_utils.hpp"

#include <chrono>

namespace riskgate {

std::int64_t LiveTimeProvider::now_ms() const {
  return timestamp_to_ms(std::chrono::system_clock::now());
}

}  // namespace riskgate
