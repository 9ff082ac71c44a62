#include "tradecore/strategy/strategy_registry.hpp"

#include <stdexcept>
#include <utility>

namespace tradecore {

void StrategyRegistry::add(std::unique_ptr<IStrategy> strategy) {
  if (!strategy) {
    throw std::invalid_argument("StrategyRegistry::add: null strategy");
  }
  strategies_.push_back(std::move(strategy));
}

// -----------------------------------------------------------------------------
// evaluate: fan the window out to every strategy, collect signals in order
// -----------------------------------------------------------------------------
std::vector<domain::TradingSignal> StrategyRegistry::evaluate(
    const std::vector<domain::PriceSample>& window,
    const domain::OrderBookSnapshot& book) const {
  std::vector<domain::TradingSignal> signals;
  for (const auto& strategy : strategies_) {
    auto signal = strategy->analyze(window, book);
    if (!signal) {
      continue;
    }
    signal->strategy = strategy->name();
    signals.push_back(std::move(*signal));
  }
  return signals;
}

std::vector<std::string> StrategyRegistry::names() const {
  std::vector<std::string> result;
  result.reserve(strategies_.size());
  for (const auto& strategy : strategies_) {
    result.push_back(strategy->name());
  }
  return result;
}

}  // namespace tradecore
