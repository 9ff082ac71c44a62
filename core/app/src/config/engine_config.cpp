#include "tradecore/config/engine_config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <type_traits>

namespace tradecore {

namespace {

using json = nlohmann::json;

// Copies doc[key] into `out` when present. A present key with the wrong JSON
// type is reported with its dotted path, e.g. "risk.max_daily_loss".
// Unsigned targets only take non-negative integers that fit; nlohmann would
// otherwise wrap -1 into a huge count.
template <typename T>
void readOptional(const json& section, const std::string& path,
                  const char* key, T& out) {
  auto it = section.find(key);
  if (it == section.end()) {
    return;
  }
  if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T> &&
                !std::is_same_v<T, bool>) {
    if (!it->is_number_unsigned() ||
        it->template get<std::uint64_t>() > std::numeric_limits<T>::max()) {
      throw ConfigError("config key '" + path + key +
                        "' must be a non-negative integer in range");
    }
  }
  try {
    out = it->template get<T>();
  } catch (const json::exception& e) {
    throw ConfigError("config key '" + path + key + "': " + e.what());
  }
}

template <typename Duration>
void readDuration(const json& section, const std::string& path,
                  const char* key, Duration& out) {
  std::int64_t count = out.count();
  readOptional(section, path, key, count);
  out = Duration(count);
}

const json* subsection(const json& parent, const char* key,
                       const std::string& path) {
  auto it = parent.find(key);
  if (it == parent.end()) {
    return nullptr;
  }
  if (!it->is_object()) {
    throw ConfigError("config key '" + path + key + "' must be an object");
  }
  return &*it;
}

void requirePositive(double value, const char* what) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw ConfigError(std::string(what) + " must be positive");
  }
}

void requireNonNegative(double value, const char* what) {
  if (!std::isfinite(value) || value < 0.0) {
    throw ConfigError(std::string(what) + " must not be negative");
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// engineConfigFromJson()
// -----------------------------------------------------------------------------
EngineConfig engineConfigFromJson(const json& doc) {
  if (!doc.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }

  EngineConfig config;

  readOptional(doc, "", "symbols", config.symbols);

  if (const json* risk = subsection(doc, "risk", "")) {
    readOptional(*risk, "risk.", "max_position_size",
                 config.risk.max_position_size);
    readOptional(*risk, "risk.", "max_loss_per_trade",
                 config.risk.max_loss_per_trade);
    readOptional(*risk, "risk.", "max_daily_loss", config.risk.max_daily_loss);
    readOptional(*risk, "risk.", "stop_loss_pct", config.risk.stop_loss_pct);
    readOptional(*risk, "risk.", "take_profit_pct",
                 config.risk.take_profit_pct);
  }

  if (const json* strategies = subsection(doc, "strategies", "")) {
    if (const json* m =
            subsection(*strategies, "momentum", "strategies.")) {
      const std::string path = "strategies.momentum.";
      readOptional(*m, path, "enabled", config.momentum.enabled);
      readOptional(*m, path, "lookback_period",
                   config.momentum.lookback_period);
      readOptional(*m, path, "threshold", config.momentum.threshold);
      readOptional(*m, path, "quantity", config.momentum.quantity);
      readOptional(*m, path, "min_average_volume",
                   config.momentum.min_average_volume);
    }
    if (const json* mr =
            subsection(*strategies, "mean_reversion", "strategies.")) {
      const std::string path = "strategies.mean_reversion.";
      readOptional(*mr, path, "enabled", config.mean_reversion.enabled);
      readOptional(*mr, path, "lookback_period",
                   config.mean_reversion.lookback_period);
      readOptional(*mr, path, "threshold", config.mean_reversion.threshold);
      readOptional(*mr, path, "quantity", config.mean_reversion.quantity);
    }
  }

  if (const json* engine = subsection(doc, "engine", "")) {
    readDuration(*engine, "engine.", "ingest_interval_ms",
                 config.ingest_interval);
    readDuration(*engine, "engine.", "decision_interval_ms",
                 config.decision_interval);
    readOptional(*engine, "engine.", "min_samples", config.min_samples);
    readOptional(*engine, "engine.", "history_capacity",
                 config.history_capacity);
    readDuration(*engine, "engine.", "gateway_timeout_ms",
                 config.gateway_timeout);
    readDuration(*engine, "engine.", "run_duration_s", config.run_duration);
  }

  if (const json* md = subsection(doc, "market_data", "")) {
    readOptional(*md, "market_data.", "endpoint",
                 config.market_data_endpoint);
    readOptional(*md, "market_data.", "initial_price",
                 config.simulated_market.initial_price);
    readOptional(*md, "market_data.", "volatility",
                 config.simulated_market.volatility);
    readOptional(*md, "market_data.", "seed", config.simulated_market.seed);
  }

  if (const json* gw = subsection(doc, "gateway", "")) {
    readDuration(*gw, "gateway.", "latency_ms",
                 config.simulated_gateway.latency);
    readOptional(*gw, "gateway.", "reject_ratio",
                 config.simulated_gateway.reject_ratio);
  }

  validateEngineConfig(config);
  return config;
}

// -----------------------------------------------------------------------------
// loadEngineConfig()
// -----------------------------------------------------------------------------
EngineConfig loadEngineConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }

  json doc;
  try {
    doc = json::parse(in);
  } catch (const json::parse_error& e) {
    throw ConfigError("config file '" + path + "' is not valid JSON: " +
                      e.what());
  }
  return engineConfigFromJson(doc);
}

// -----------------------------------------------------------------------------
// validateEngineConfig()
// -----------------------------------------------------------------------------
void validateEngineConfig(const EngineConfig& config) {
  if (config.symbols.empty()) {
    throw ConfigError("symbols must not be empty");
  }
  for (const auto& symbol : config.symbols) {
    if (symbol.empty()) {
      throw ConfigError("symbols must not contain an empty string");
    }
  }

  try {
    domain::validateRiskParams(config.risk);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }

  if (config.momentum.lookback_period < 2) {
    throw ConfigError("strategies.momentum.lookback_period must be >= 2");
  }
  requireNonNegative(config.momentum.threshold,
                     "strategies.momentum.threshold");
  requirePositive(config.momentum.quantity, "strategies.momentum.quantity");
  requireNonNegative(config.momentum.min_average_volume,
                     "strategies.momentum.min_average_volume");

  if (config.mean_reversion.lookback_period == 0) {
    throw ConfigError("strategies.mean_reversion.lookback_period must be > 0");
  }
  requireNonNegative(config.mean_reversion.threshold,
                     "strategies.mean_reversion.threshold");
  requirePositive(config.mean_reversion.quantity,
                  "strategies.mean_reversion.quantity");

  if (config.ingest_interval.count() <= 0 ||
      config.decision_interval.count() <= 0) {
    throw ConfigError("engine loop intervals must be positive");
  }
  if (config.min_samples == 0) {
    throw ConfigError("engine.min_samples must be > 0");
  }
  if (config.history_capacity == 0) {
    throw ConfigError("engine.history_capacity must be > 0");
  }

  std::size_t largest_lookback = 0;
  if (config.momentum.enabled) {
    largest_lookback =
        std::max(largest_lookback, config.momentum.lookback_period);
  }
  if (config.mean_reversion.enabled) {
    largest_lookback =
        std::max(largest_lookback, config.mean_reversion.lookback_period);
  }
  if (config.history_capacity < largest_lookback) {
    throw ConfigError(
        "engine.history_capacity is smaller than an enabled strategy's "
        "lookback_period");
  }

  if (config.gateway_timeout.count() <= 0) {
    throw ConfigError("engine.gateway_timeout_ms must be positive");
  }
  if (config.run_duration.count() <= 0) {
    throw ConfigError("engine.run_duration_s must be positive");
  }

  requirePositive(config.simulated_market.initial_price,
                  "market_data.initial_price");
  requireNonNegative(config.simulated_market.volatility,
                     "market_data.volatility");

  if (config.simulated_gateway.latency.count() < 0) {
    throw ConfigError("gateway.latency_ms must not be negative");
  }
  const double ratio = config.simulated_gateway.reject_ratio;
  if (!std::isfinite(ratio) || ratio < 0.0 || ratio > 1.0) {
    throw ConfigError("gateway.reject_ratio must be within [0, 1]");
  }
}

}  // namespace tradecore
