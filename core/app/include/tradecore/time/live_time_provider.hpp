#pragma once

#include "tradecore/time/i_time_provider.hpp"

namespace tradecore {

// -----------------------------------------------------------------------------
// LiveTimeProvider: system_clock backed ITimeProvider
// -----------------------------------------------------------------------------
// Used by the tradecore executable. Stateless, so a single instance can be
// shared by every loop without synchronization.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace tradecore
