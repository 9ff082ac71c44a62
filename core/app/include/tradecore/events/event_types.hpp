#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/position.hpp"
#include "tradecore/domain/trading_signal.hpp"
#include "tradecore/risk/risk_decision.hpp"
#include "tradecore/time/time_utils.hpp"

#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// Engine events
// -----------------------------------------------------------------------------
// Published on the Orchestrator's EventBus so observers (the executable's
// loggers, tests) can follow the decision pipeline without reaching into
// component state. Every event is a plain value snapshot.
//
// Publishing thread:
//   SignalEvent .. PositionUpdateEvent  → decision loop thread
//   OrderCompletedEvent                 → gateway worker thread
//   LoopFaultEvent                      → the faulted loop's thread
// -----------------------------------------------------------------------------

// A strategy produced a signal; published before risk validation.
struct SignalEvent {
  domain::TradingSignal signal;
  Timestamp timestamp{};
};

// RiskManager refused the candidate order. The order never reached the
// gateway and the ledger is unchanged.
struct RiskRejectEvent {
  domain::Order order;
  RejectReason reason{RejectReason::None};
  std::string detail;
  Timestamp timestamp{};
};

// The gateway acknowledged the order; it is now pending.
struct OrderSubmittedEvent {
  domain::Order order;
  ProtectiveLevels levels;
  Timestamp timestamp{};
};

// Risk approved the order but the gateway rejected it, failed, timed out,
// or the engine stopped while waiting. The ledger is unchanged.
struct OrderFailedEvent {
  domain::Order order;
  std::string reason;
  Timestamp timestamp{};
};

// Ledger state for order.symbol after an accepted order was applied.
struct PositionUpdateEvent {
  domain::OrderId order_id{};
  domain::Position position;
  Timestamp timestamp{};
};

// An execution report moved a pending order to a terminal status.
struct OrderCompletedEvent {
  domain::Order order;
  double fill_price{0.0};
  Timestamp timestamp{};
};

// A polling loop hit an InvariantViolation and stopped.
struct LoopFaultEvent {
  std::string loop_name;
  std::string reason;
  Timestamp timestamp{};
};

}  // namespace tradecore
