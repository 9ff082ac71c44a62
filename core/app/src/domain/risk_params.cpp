#include "tradecore/domain/risk_params.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace tradecore {
namespace domain {

namespace {

void requirePositive(const char* field, double value) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw std::invalid_argument(std::string("RiskParams.") + field +
                                " must be a positive finite number (got " +
                                std::to_string(value) + ")");
  }
}

}  // namespace

void validateRiskParams(const RiskParams& params) {
  requirePositive("max_position_size", params.max_position_size);
  requirePositive("max_loss_per_trade", params.max_loss_per_trade);
  requirePositive("max_daily_loss", params.max_daily_loss);
  requirePositive("stop_loss_pct", params.stop_loss_pct);
  requirePositive("take_profit_pct", params.take_profit_pct);
}

}  // namespace domain
}  // namespace tradecore
