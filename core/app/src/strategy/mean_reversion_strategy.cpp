#include "tradecore/strategy/mean_reversion_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tradecore {

MeanReversionStrategy::MeanReversionStrategy(std::size_t lookback_period,
                                             double deviation_threshold,
                                             double quantity)
    : lookback_period_(lookback_period),
      deviation_threshold_(deviation_threshold),
      quantity_(quantity) {
  if (lookback_period_ == 0) {
    throw std::invalid_argument(
        "MeanReversionStrategy lookback_period must be at least 1");
  }
  if (!(deviation_threshold_ >= 0.0) || !std::isfinite(deviation_threshold_)) {
    throw std::invalid_argument(
        "MeanReversionStrategy threshold must be a non-negative number");
  }
  if (!(quantity_ > 0.0) || !std::isfinite(quantity_)) {
    throw std::invalid_argument(
        "MeanReversionStrategy quantity must be positive");
  }
}

std::optional<domain::TradingSignal> MeanReversionStrategy::analyze(
    const std::vector<domain::PriceSample>& window,
    const domain::OrderBookSnapshot& /*book*/) const {
  if (window.size() < lookback_period_) {
    return std::nullopt;
  }

  const auto first =
      window.end() - static_cast<std::ptrdiff_t>(lookback_period_);
  double price_sum = 0.0;
  for (auto it = first; it != window.end(); ++it) {
    price_sum += it->price;
  }
  const double mean = price_sum / static_cast<double>(lookback_period_);
  if (mean <= 0.0) {
    return std::nullopt;
  }

  const domain::PriceSample& newest = window.back();
  const double deviation = (newest.price - mean) / mean;

  if (std::abs(deviation) <= deviation_threshold_) {
    return std::nullopt;
  }

  // Above the mean: expect a move back down.
  domain::TradingSignal signal;
  signal.strategy = name();
  signal.symbol = newest.symbol;
  signal.side = (deviation > 0.0) ? domain::Side::Sell : domain::Side::Buy;
  signal.confidence = std::min(std::abs(deviation), 1.0);
  signal.target_price = mean;
  signal.quantity = quantity_;
  return signal;
}

}  // namespace tradecore
