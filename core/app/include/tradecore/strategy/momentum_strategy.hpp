#pragma once

#include "tradecore/strategy/i_strategy.hpp"

#include <cstddef>

namespace tradecore {

// -----------------------------------------------------------------------------
// MomentumStrategy
// -----------------------------------------------------------------------------
//
// @brief  Trades in the direction of a sufficiently large, liquid move over
//         the last `lookback_period` samples.
//
// @details
// Over the most recent lookback_period samples:
//   change      = (newest.price - oldest.price) / oldest.price
//   mean_volume = average of their volumes
//
// A signal is produced iff |change| > momentum_threshold AND
// mean_volume > min_average_volume:
//   side         Buy if change > 0, Sell otherwise
//   confidence   min(|change|, 1.0)
//   target_price newest.price
//   quantity     the configured base size
//
// Windows shorter than lookback_period produce no signal.
// -----------------------------------------------------------------------------
class MomentumStrategy final : public IStrategy {
 public:
  static constexpr std::size_t kDefaultLookback = 10;
  static constexpr double kDefaultThreshold = 0.02;
  static constexpr double kDefaultQuantity = 100.0;
  static constexpr double kDefaultMinAverageVolume = 1000.0;

  // Throws std::invalid_argument if lookback_period < 2, the threshold or
  // minimum volume is negative, or quantity is not positive.
  MomentumStrategy(std::size_t lookback_period = kDefaultLookback,
                   double momentum_threshold = kDefaultThreshold,
                   double quantity = kDefaultQuantity,
                   double min_average_volume = kDefaultMinAverageVolume);

  std::optional<domain::TradingSignal> analyze(
      const std::vector<domain::PriceSample>& window,
      const domain::OrderBookSnapshot& book) const override;

  std::string name() const override { return "MomentumStrategy"; }

 private:
  const std::size_t lookback_period_;
  const double momentum_threshold_;
  const double quantity_;
  const double min_average_volume_;
};

}  // namespace tradecore
