#pragma once

#include <string>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// RejectReason
// -----------------------------------------------------------------------------
// Why RiskManager refused an order. The first four classify malformed input
// and are checked before any limit; the last three are the limit checks in
// the order they are evaluated.
// -----------------------------------------------------------------------------
enum class RejectReason {
  None,
  InvalidSymbol,
  InvalidQuantity,
  InvalidPrice,
  InvalidOrderType,
  DailyLossLimit,
  PositionLimit,
  LossPerTrade,
};

const char* toString(RejectReason reason);

// -----------------------------------------------------------------------------
// RiskDecision
// -----------------------------------------------------------------------------
// Result of RiskManager::validate(). detail is a human-readable explanation
// with the values involved; empty when approved.
// -----------------------------------------------------------------------------
struct RiskDecision {
  bool approved{false};
  RejectReason reason{RejectReason::None};
  std::string detail;

  static RiskDecision approve() {
    return RiskDecision{true, RejectReason::None, {}};
  }

  static RiskDecision reject(RejectReason reason, std::string detail) {
    return RiskDecision{false, reason, std::move(detail)};
  }
};

// Stop-loss and take-profit prices for an entry, derived from RiskParams.
struct ProtectiveLevels {
  double stop_loss{0.0};
  double take_profit{0.0};
};

}  // namespace tradecore
