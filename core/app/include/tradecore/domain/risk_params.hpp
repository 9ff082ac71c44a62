#pragma once

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// RiskParams: engine-wide risk thresholds
// -----------------------------------------------------------------------------
//
// @brief  Limits applied by RiskManager to every candidate order.
//
// @details
// All five values must be strictly positive and finite. Percentages are
// fractions (0.02 == 2%). They are copied into RiskManager at construction
// and stay constant for the engine's lifetime; EngineConfig loads them from
// the "risk" section of the JSON configuration.
// -----------------------------------------------------------------------------
struct RiskParams {
  /// Maximum absolute net quantity per symbol after an order is applied.
  double max_position_size{1000.0};

  /// Maximum projected loss of a single order if its stop-loss triggers:
  /// quantity * reference_price * stop_loss_pct.
  double max_loss_per_trade{100.0};

  /// Trading stops once the daily P&L accumulator falls below
  /// -max_daily_loss.
  double max_daily_loss{500.0};

  double stop_loss_pct{0.02};
  double take_profit_pct{0.04};
};

// -----------------------------------------------------------------------------
// validateRiskParams(params)
// -----------------------------------------------------------------------------
// @brief  Throws std::invalid_argument naming the first field that is not a
//         strictly positive finite number.
// -----------------------------------------------------------------------------
void validateRiskParams(const RiskParams& params);

}  // namespace domain
}  // namespace tradecore
