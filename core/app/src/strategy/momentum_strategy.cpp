#include "tradecore/strategy/momentum_strategy.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace tradecore {

MomentumStrategy::MomentumStrategy(std::size_t lookback_period,
                                   double momentum_threshold,
                                   double quantity,
                                   double min_average_volume)
    : lookback_period_(lookback_period),
      momentum_threshold_(momentum_threshold),
      quantity_(quantity),
      min_average_volume_(min_average_volume) {
  if (lookback_period_ < 2) {
    throw std::invalid_argument(
        "MomentumStrategy lookback_period must be at least 2");
  }
  if (!(momentum_threshold_ >= 0.0) || !std::isfinite(momentum_threshold_)) {
    throw std::invalid_argument(
        "MomentumStrategy threshold must be a non-negative number");
  }
  if (!(quantity_ > 0.0) || !std::isfinite(quantity_)) {
    throw std::invalid_argument("MomentumStrategy quantity must be positive");
  }
  if (!(min_average_volume_ >= 0.0) || !std::isfinite(min_average_volume_)) {
    throw std::invalid_argument(
        "MomentumStrategy min_average_volume must be non-negative");
  }
}

// -----------------------------------------------------------------------------
// analyze: relative change across the lookback window, gated on volume
// -----------------------------------------------------------------------------
std::optional<domain::TradingSignal> MomentumStrategy::analyze(
    const std::vector<domain::PriceSample>& window,
    const domain::OrderBookSnapshot& /*book*/) const {
  if (window.size() < lookback_period_) {
    return std::nullopt;
  }

  const auto first =
      window.end() - static_cast<std::ptrdiff_t>(lookback_period_);
  const domain::PriceSample& oldest = *first;
  const domain::PriceSample& newest = window.back();

  if (oldest.price <= 0.0) {
    return std::nullopt;
  }

  const double change = (newest.price - oldest.price) / oldest.price;

  double volume_sum = 0.0;
  for (auto it = first; it != window.end(); ++it) {
    volume_sum += it->volume;
  }
  const double mean_volume =
      volume_sum / static_cast<double>(lookback_period_);

  if (std::abs(change) <= momentum_threshold_ ||
      mean_volume <= min_average_volume_) {
    return std::nullopt;
  }

  domain::TradingSignal signal;
  signal.strategy = name();
  signal.symbol = newest.symbol;
  signal.side = (change > 0.0) ? domain::Side::Buy : domain::Side::Sell;
  signal.confidence = std::min(std::abs(change), 1.0);
  signal.target_price = newest.price;
  signal.quantity = quantity_;
  return signal;
}

}  // namespace tradecore
