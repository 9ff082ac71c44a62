#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/position.hpp"
#include "tradecore/domain/risk_params.hpp"
#include "tradecore/risk/risk_decision.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tradecore {

// -----------------------------------------------------------------------------
// RiskManager
// -----------------------------------------------------------------------------
//
// @brief  Pre-trade gate and position ledger. Decides whether a candidate
//         order may be sent and records the effect of every order that was.
//
// @details
// State (RiskState):
//   - daily P&L accumulator, fed by the realized P&L of every reducing
//     updatePosition() and by recordPnl(), cleared by resetDailyPnl() on
//     the external daily rollover.
//   - symbol → Position ledger, mutated only by updatePosition().
//
// Validation (validate), in this order, stopping at the first failure:
//   0. Malformed input → InvalidSymbol / InvalidQuantity / InvalidPrice /
//      InvalidOrderType. Reported as rejections, never thrown.
//   1. DailyLossLimit  : daily P&L < -max_daily_loss.
//   2. PositionLimit   : only when the symbol already has a ledger entry:
//                        |qty ± order.quantity| > max_position_size.
//   3. LossPerTrade    : quantity * reference_price * stop_loss_pct >
//                        max_loss_per_trade.
// Every check reads committed ledger state only.
//
// Ledger update (updatePosition):
//   new_avg = (old_qty * old_avg + delta * price) / (old_qty + delta)
//   with two explicit policies:
//     - the position nets to zero     → average_price resets to 0
//     - the position opens from flat,
//       or crosses zero               → average_price becomes `price`
//   A fill against the position realizes
//     min(|old_qty|, |delta|) * (price - old_avg) * sign(old_qty)
//   into both Position::realized_pnl and the daily accumulator.
//   The update is NOT idempotent. It must run exactly once per order that
//   was accepted by the gateway; replaying it double-counts.
//
// Atomic validate-then-commit:
//   A single std::mutex guards the whole state. validateAndCommit() holds it
//   across validate → submit → updatePosition so two concurrent signals on
//   the same symbol cannot both pass validation against the same
//   pre-update position.
//
// Thread model:
//   Every public method is safe from any thread. The submit callback passed
//   to validateAndCommit() runs with the mutex held and must not call back
//   into this RiskManager.
//
// Ownership:
//   Held by the Orchestrator through a shared_ptr and shared with the
//   DecisionLoop.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  // Returns true iff the gateway confirmed the order.
  using SubmitFn = std::function<bool(const domain::Order&)>;

  // Outcome of validateAndCommit().
  struct CommitResult {
    RiskDecision decision;
    bool submitted{false};
    std::optional<domain::Position> position;  // Ledger after the update
  };

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  params  Risk thresholds, copied. Throws std::invalid_argument if
  //                 any value is not a positive finite number.
  // -------------------------------------------------------------------------
  explicit RiskManager(const domain::RiskParams& params);

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // -------------------------------------------------------------------------
  // validate(order, reference_price)
  // -------------------------------------------------------------------------
  // @brief  Runs the checks described above against committed state.
  //
  // @return RiskDecision; approved == true only if every check passed.
  //
  // Thread-safety: Takes the state mutex.
  // Side-effects:  Logs rejections to std::cerr.
  // -------------------------------------------------------------------------
  RiskDecision validate(const domain::Order& order,
                        double reference_price) const;

  // -------------------------------------------------------------------------
  // updatePosition(symbol, signed_delta, price)
  // -------------------------------------------------------------------------
  // @brief  Applies a signed quantity change at `price` to the ledger.
  //
  // @return Snapshot of the position after the update.
  //
  // @details
  // Throws std::invalid_argument for an empty symbol, a zero or non-finite
  // delta, or a non-positive or non-finite price. Throws InvariantViolation
  // (ledger left untouched) if the update would store a non-finite value.
  //
  // Thread-safety: Takes the state mutex.
  // -------------------------------------------------------------------------
  domain::Position updatePosition(const std::string& symbol,
                                  double signed_delta, double price);

  // -------------------------------------------------------------------------
  // validateAndCommit(order, reference_price, submit)
  // -------------------------------------------------------------------------
  // @brief  validate → submit → updatePosition as one critical section.
  //
  // @details
  // submit is only invoked when validation approves. The ledger is only
  // updated, with delta = ±order.quantity at reference_price, when submit
  // returns true. Exceptions thrown by submit propagate with the ledger
  // unchanged.
  // -------------------------------------------------------------------------
  CommitResult validateAndCommit(const domain::Order& order,
                                 double reference_price,
                                 const SubmitFn& submit);

  // Adds a realized or marked P&L delta to the daily accumulator.
  // Throws std::invalid_argument if delta is not finite.
  void recordPnl(double delta);

  // External daily rollover.
  void resetDailyPnl();

  double dailyPnl() const;

  std::optional<domain::Position> position(const std::string& symbol) const;
  std::vector<domain::Position> positions() const;

  // 0 for symbols without a ledger entry.
  double unrealizedPnl(const std::string& symbol, double mark_price) const;

  // -------------------------------------------------------------------------
  // protectiveLevels(side, entry_price)
  // -------------------------------------------------------------------------
  // @brief  Stop-loss / take-profit prices for a fresh entry.
  //
  //   Buy : stop = entry * (1 - stop_loss_pct), take = entry * (1 + tp_pct)
  //   Sell: stop = entry * (1 + stop_loss_pct), take = entry * (1 - tp_pct)
  // -------------------------------------------------------------------------
  ProtectiveLevels protectiveLevels(domain::Side side,
                                    double entry_price) const;

  const domain::RiskParams& params() const { return params_; }

 private:
  RiskDecision validateLocked(const domain::Order& order,
                              double reference_price) const;
  domain::Position updatePositionLocked(const std::string& symbol,
                                        double signed_delta, double price);

  const domain::RiskParams params_;

  mutable std::mutex mutex_;
  double daily_pnl_{0.0};
  std::unordered_map<std::string, domain::Position> positions_;
};

}  // namespace tradecore
