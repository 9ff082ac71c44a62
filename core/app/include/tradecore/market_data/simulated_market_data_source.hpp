#pragma once

#include "tradecore/market_data/i_market_data_source.hpp"
#include "tradecore/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>

namespace tradecore {

struct SimulatedMarketConfig {
  double initial_price{50.0};
  double volatility{0.002};      // Std-dev of the per-tick relative return
  double min_volume{100.0};
  double max_volume{10000.0};
  std::size_t book_depth{5};
  double tick_size{0.01};        // Spacing between book levels
  std::uint32_t seed{42};
};

// -----------------------------------------------------------------------------
// SimulatedMarketDataSource
// -----------------------------------------------------------------------------
//
// @brief  Seeded random-walk prices and synthetic order books.
//
// @details
// Each symbol starts at initial_price and moves by a normally distributed
// relative return on every getPrice() call. Volumes are uniform in
// [min_volume, max_volume]. getOrderBook() builds `book_depth` levels on each
// side of the symbol's current price, `tick_size` apart, with uniform random
// sizes.
//
// The same seed and call sequence always yields the same data.
//
// Thread model: one mutex guards the generator and the per-symbol prices.
// -----------------------------------------------------------------------------
class SimulatedMarketDataSource final : public IMarketDataSource {
 public:
  SimulatedMarketDataSource(const ITimeProvider& time_provider,
                            SimulatedMarketConfig config = {});

  std::optional<domain::PriceSample> getPrice(
      const std::string& symbol) override;

  std::optional<domain::OrderBookSnapshot> getOrderBook(
      const std::string& symbol) override;

 private:
  double& priceFor(const std::string& symbol);

  const ITimeProvider& time_provider_;
  const SimulatedMarketConfig config_;

  std::mutex mutex_;
  std::mt19937 rng_;
  std::unordered_map<std::string, double> prices_;
};

}  // namespace tradecore
