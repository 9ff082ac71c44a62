#pragma once

#include "tradecore/strategy/i_strategy.hpp"

#include <cstddef>

namespace tradecore {

// -----------------------------------------------------------------------------
// MeanReversionStrategy
// -----------------------------------------------------------------------------
// Fades the newest price when it strays too far from the window mean.
//
//   mean      = average price of the last lookback_period samples
//   deviation = (newest.price - mean) / mean
//
// Signal iff |deviation| > deviation_threshold. Sell when the price is above
// the mean, Buy when below. Confidence min(|deviation|, 1.0); the target is
// the mean itself.
// -----------------------------------------------------------------------------
class MeanReversionStrategy final : public IStrategy {
 public:
  static constexpr std::size_t kDefaultLookback = 20;
  static constexpr double kDefaultThreshold = 0.03;
  static constexpr double kDefaultQuantity = 50.0;

  // Throws std::invalid_argument if lookback_period is 0, the threshold is
  // negative, or quantity is not positive.
  MeanReversionStrategy(std::size_t lookback_period = kDefaultLookback,
                        double deviation_threshold = kDefaultThreshold,
                        double quantity = kDefaultQuantity);

  std::optional<domain::TradingSignal> analyze(
      const std::vector<domain::PriceSample>& window,
      const domain::OrderBookSnapshot& book) const override;

  std::string name() const override { return "MeanReversionStrategy"; }

 private:
  const std::size_t lookback_period_;
  const double deviation_threshold_;
  const double quantity_;
};

}  // namespace tradecore
