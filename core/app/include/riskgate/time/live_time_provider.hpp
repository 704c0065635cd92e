#pragma once

#include "riskgate/time/i_time_provider.hpp"

namespace riskgate {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider used by risk_server
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace riskgate
