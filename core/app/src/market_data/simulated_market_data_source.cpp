#include "tradecore/market_data/simulated_market_data_source.hpp"

#include "tradecore/time/time_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace tradecore {

namespace {

// Floor that keeps a long random walk from reaching zero or below.
constexpr double kMinPrice = 0.01;

}  // namespace

SimulatedMarketDataSource::SimulatedMarketDataSource(
    const ITimeProvider& time_provider, SimulatedMarketConfig config)
    : time_provider_(time_provider), config_(config), rng_(config.seed) {
  if (config_.initial_price <= 0.0) {
    throw std::invalid_argument(
        "SimulatedMarketDataSource initial_price must be positive");
  }
  if (config_.volatility < 0.0) {
    throw std::invalid_argument(
        "SimulatedMarketDataSource volatility must be non-negative");
  }
  if (config_.min_volume < 0.0 || config_.max_volume < config_.min_volume) {
    throw std::invalid_argument(
        "SimulatedMarketDataSource volume range is invalid");
  }
}

double& SimulatedMarketDataSource::priceFor(const std::string& symbol) {
  auto it = prices_.find(symbol);
  if (it == prices_.end()) {
    it = prices_.emplace(symbol, config_.initial_price).first;
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// getPrice(): one random-walk step
// -----------------------------------------------------------------------------
std::optional<domain::PriceSample> SimulatedMarketDataSource::getPrice(
    const std::string& symbol) {
  std::lock_guard lock(mutex_);

  double& price = priceFor(symbol);
  if (config_.volatility > 0.0) {
    std::normal_distribution<double> step(0.0, config_.volatility);
    price = std::max(kMinPrice, price * (1.0 + step(rng_)));
  }

  std::uniform_real_distribution<double> volume(config_.min_volume,
                                                config_.max_volume);

  domain::PriceSample sample;
  sample.symbol = symbol;
  sample.price = price;
  sample.volume = volume(rng_);
  sample.timestamp = ms_to_timestamp(time_provider_.now_ms());
  return sample;
}

// -----------------------------------------------------------------------------
// getOrderBook(): ladder around the current price
// -----------------------------------------------------------------------------
std::optional<domain::OrderBookSnapshot>
SimulatedMarketDataSource::getOrderBook(const std::string& symbol) {
  std::lock_guard lock(mutex_);

  const double mid = priceFor(symbol);
  std::uniform_real_distribution<double> size(10.0, 1000.0);

  domain::OrderBookSnapshot book;
  book.symbol = symbol;
  book.timestamp = ms_to_timestamp(time_provider_.now_ms());
  book.bids.reserve(config_.book_depth);
  book.asks.reserve(config_.book_depth);

  for (std::size_t level = 1; level <= config_.book_depth; ++level) {
    const double offset = static_cast<double>(level) * config_.tick_size;
    book.bids.push_back({std::max(kMinPrice, mid - offset), size(rng_)});
    book.asks.push_back({mid + offset, size(rng_)});
  }
  return book;
}

}  // namespace tradecore
