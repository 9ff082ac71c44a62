#pragma once

#include "tradecore/domain/risk_params.hpp"
#include "tradecore/execution/simulated_order_gateway.hpp"
#include "tradecore/market_data/simulated_market_data_source.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// ConfigError
// -----------------------------------------------------------------------------
// @brief  Raised when a configuration file is missing, is not valid JSON,
//         has a key of the wrong type or holds an out-of-range value.
// -----------------------------------------------------------------------------
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct MomentumConfig {
  bool enabled{true};
  std::size_t lookback_period{10};
  double threshold{0.02};
  double quantity{100.0};
  double min_average_volume{1000.0};
};

struct MeanReversionConfig {
  bool enabled{true};
  std::size_t lookback_period{20};
  double threshold{0.03};
  double quantity{50.0};
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
//
// @brief  Everything the executable needs to build an Orchestrator and its
//         collaborators. Defaults match the compiled-in component defaults,
//         so an empty JSON object is a valid configuration.
//
// @details
// JSON layout (every key optional):
//
//   symbols                   array of strings
//   risk.*                    RiskParams fields
//   strategies.momentum.*     MomentumConfig fields
//   strategies.mean_reversion.*
//   engine.ingest_interval_ms, engine.decision_interval_ms,
//   engine.min_samples, engine.history_capacity,
//   engine.gateway_timeout_ms, engine.run_duration_s
//   market_data.endpoint      ZeroMQ SUB endpoint; empty selects the
//                             simulated random-walk source
//   market_data.initial_price, .volatility, .seed
//   gateway.latency_ms, gateway.reject_ratio
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::vector<std::string> symbols{"SOL/USDT", "BTC/USDT", "ETH/USDT"};

  domain::RiskParams risk;

  MomentumConfig momentum;
  MeanReversionConfig mean_reversion;

  std::chrono::milliseconds ingest_interval{100};
  std::chrono::milliseconds decision_interval{50};
  std::size_t min_samples{10};
  std::size_t history_capacity{1000};
  std::chrono::milliseconds gateway_timeout{500};
  std::chrono::seconds run_duration{60};

  std::string market_data_endpoint;
  SimulatedMarketConfig simulated_market;
  SimulatedGatewayConfig simulated_gateway;
};

// Builds a config from a parsed JSON document, starting from the defaults
// above. Throws ConfigError on a type mismatch or an invalid value.
EngineConfig engineConfigFromJson(const nlohmann::json& doc);

// Reads and parses `path`, then applies engineConfigFromJson().
// Throws ConfigError if the file cannot be opened or parsed.
EngineConfig loadEngineConfig(const std::string& path);

// Range checks shared by both loaders. Throws ConfigError.
void validateEngineConfig(const EngineConfig& config);

}  // namespace tradecore
