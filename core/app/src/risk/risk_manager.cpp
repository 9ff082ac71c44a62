#include "tradecore/risk/risk_manager.hpp"

#include "tradecore/common/invariant_violation.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace tradecore {

const char* toString(RejectReason reason) {
  switch (reason) {
    case RejectReason::None:
      return "None";
    case RejectReason::InvalidSymbol:
      return "InvalidSymbol";
    case RejectReason::InvalidQuantity:
      return "InvalidQuantity";
    case RejectReason::InvalidPrice:
      return "InvalidPrice";
    case RejectReason::InvalidOrderType:
      return "InvalidOrderType";
    case RejectReason::DailyLossLimit:
      return "DailyLossLimit";
    case RejectReason::PositionLimit:
      return "PositionLimit";
    case RejectReason::LossPerTrade:
      return "LossPerTrade";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Constructor: reject unusable limits up front
// -----------------------------------------------------------------------------
RiskManager::RiskManager(const domain::RiskParams& params) : params_(params) {
  domain::validateRiskParams(params_);
}

RiskDecision RiskManager::validate(const domain::Order& order,
                                   double reference_price) const {
  std::lock_guard lock(mutex_);
  return validateLocked(order, reference_price);
}

domain::Position RiskManager::updatePosition(const std::string& symbol,
                                             double signed_delta,
                                             double price) {
  std::lock_guard lock(mutex_);
  return updatePositionLocked(symbol, signed_delta, price);
}

// -----------------------------------------------------------------------------
// validateAndCommit: one lock across validate, submit and the ledger update
// -----------------------------------------------------------------------------
RiskManager::CommitResult RiskManager::validateAndCommit(
    const domain::Order& order, double reference_price,
    const SubmitFn& submit) {
  std::lock_guard lock(mutex_);

  CommitResult result;
  result.decision = validateLocked(order, reference_price);
  if (!result.decision.approved) {
    return result;
  }

  result.submitted = submit(order);
  if (!result.submitted) {
    return result;
  }

  const double delta = domain::signedQuantity(order.side, order.quantity);
  result.position = updatePositionLocked(order.symbol, delta, reference_price);
  return result;
}

void RiskManager::recordPnl(double delta) {
  if (!std::isfinite(delta)) {
    throw std::invalid_argument("RiskManager::recordPnl: non-finite delta");
  }
  std::lock_guard lock(mutex_);
  daily_pnl_ += delta;
}

void RiskManager::resetDailyPnl() {
  std::lock_guard lock(mutex_);
  daily_pnl_ = 0.0;
}

double RiskManager::dailyPnl() const {
  std::lock_guard lock(mutex_);
  return daily_pnl_;
}

std::optional<domain::Position> RiskManager::position(
    const std::string& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(symbol);
  if (it == positions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> RiskManager::positions() const {
  std::lock_guard lock(mutex_);
  std::vector<domain::Position> result;
  result.reserve(positions_.size());
  for (const auto& [symbol, pos] : positions_) {
    result.push_back(pos);
  }
  return result;
}

double RiskManager::unrealizedPnl(const std::string& symbol,
                                  double mark_price) const {
  std::lock_guard lock(mutex_);
  auto it = positions_.find(symbol);
  return (it != positions_.end()) ? it->second.unrealizedPnl(mark_price) : 0.0;
}

ProtectiveLevels RiskManager::protectiveLevels(domain::Side side,
                                               double entry_price) const {
  ProtectiveLevels levels;
  if (side == domain::Side::Buy) {
    levels.stop_loss = entry_price * (1.0 - params_.stop_loss_pct);
    levels.take_profit = entry_price * (1.0 + params_.take_profit_pct);
  } else {
    levels.stop_loss = entry_price * (1.0 + params_.stop_loss_pct);
    levels.take_profit = entry_price * (1.0 - params_.take_profit_pct);
  }
  return levels;
}

// -----------------------------------------------------------------------------
// validateLocked: input classification, then the three limit checks
// -----------------------------------------------------------------------------
RiskDecision RiskManager::validateLocked(const domain::Order& order,
                                         double reference_price) const {
  auto reject = [&order](RejectReason reason, const std::string& detail) {
    std::cerr << "[RiskManager] Order " << order.id << " (" << order.symbol
              << ") rejected: " << toString(reason) << " - " << detail
              << "\n";
    return RiskDecision::reject(reason, detail);
  };

  // --- Malformed input ------------------------------------------------------
  if (order.symbol.empty()) {
    return reject(RejectReason::InvalidSymbol, "empty symbol");
  }
  if (!std::isfinite(order.quantity) || order.quantity <= 0.0) {
    std::ostringstream os;
    os << "quantity " << order.quantity << " is not positive";
    return reject(RejectReason::InvalidQuantity, os.str());
  }
  if (!std::isfinite(reference_price) || reference_price <= 0.0) {
    std::ostringstream os;
    os << "reference price " << reference_price << " is not positive";
    return reject(RejectReason::InvalidPrice, os.str());
  }
  const bool is_limit = order.type == domain::OrderType::Limit;
  if (is_limit != order.limit_price.has_value()) {
    return reject(RejectReason::InvalidOrderType,
                  is_limit ? "limit order without a limit price"
                           : "market order carries a limit price");
  }
  if (is_limit &&
      (!std::isfinite(*order.limit_price) || *order.limit_price <= 0.0)) {
    return reject(RejectReason::InvalidPrice, "limit price is not positive");
  }

  // --- 1. Daily loss --------------------------------------------------------
  if (daily_pnl_ < -params_.max_daily_loss) {
    std::ostringstream os;
    os << "daily P&L " << daily_pnl_ << " below -" << params_.max_daily_loss;
    return reject(RejectReason::DailyLossLimit, os.str());
  }

  // --- 2. Position size (only for symbols already in the ledger) -----------
  auto it = positions_.find(order.symbol);
  if (it != positions_.end()) {
    const double resulting =
        it->second.quantity +
        domain::signedQuantity(order.side, order.quantity);
    if (std::abs(resulting) > params_.max_position_size) {
      std::ostringstream os;
      os << "resulting position " << resulting << " exceeds "
         << params_.max_position_size;
      return reject(RejectReason::PositionLimit, os.str());
    }
  }

  // --- 3. Loss exposure -----------------------------------------------------
  const double potential_loss =
      order.quantity * reference_price * params_.stop_loss_pct;
  if (potential_loss > params_.max_loss_per_trade) {
    std::ostringstream os;
    os << "potential loss " << potential_loss << " exceeds "
       << params_.max_loss_per_trade;
    return reject(RejectReason::LossPerTrade, os.str());
  }

  return RiskDecision::approve();
}

// -----------------------------------------------------------------------------
// updatePositionLocked: weighted average with flat / crossing policies
// -----------------------------------------------------------------------------
domain::Position RiskManager::updatePositionLocked(const std::string& symbol,
                                                   double signed_delta,
                                                   double price) {
  if (symbol.empty()) {
    throw std::invalid_argument("updatePosition: empty symbol");
  }
  if (!std::isfinite(signed_delta) || signed_delta == 0.0) {
    throw std::invalid_argument("updatePosition: delta must be non-zero");
  }
  if (!std::isfinite(price) || price <= 0.0) {
    throw std::invalid_argument("updatePosition: price must be positive");
  }

  auto it = positions_.find(symbol);
  const double old_qty = (it != positions_.end()) ? it->second.quantity : 0.0;
  const double old_avg =
      (it != positions_.end()) ? it->second.average_price : 0.0;

  // Opposite-direction fills close up to |old_qty| at `price` against the
  // old average: closed * (price - old_avg) * sign(old_qty).
  double realized = 0.0;
  if (old_qty != 0.0 && (old_qty > 0.0) != (signed_delta > 0.0)) {
    const double closed_qty =
        std::min(std::abs(old_qty), std::abs(signed_delta));
    const double direction_sign = (old_qty > 0.0) ? 1.0 : -1.0;
    realized = closed_qty * (price - old_avg) * direction_sign;
  }

  const double new_qty = old_qty + signed_delta;
  double new_avg = 0.0;
  if (new_qty == 0.0) {
    new_avg = 0.0;
  } else if (old_qty == 0.0 || (old_qty > 0.0) != (new_qty > 0.0)) {
    new_avg = price;
  } else {
    new_avg = (old_qty * old_avg + signed_delta * price) / new_qty;
  }

  if (!std::isfinite(new_qty) || !std::isfinite(new_avg) ||
      !std::isfinite(daily_pnl_ + realized)) {
    std::ostringstream os;
    os << "non-finite ledger value for " << symbol << " (qty=" << new_qty
       << ", avg=" << new_avg << ", realized=" << realized << ")";
    throw InvariantViolation(os.str());
  }

  domain::Position& pos = positions_[symbol];
  pos.symbol = symbol;
  pos.quantity = new_qty;
  pos.average_price = new_avg;
  pos.realized_pnl += realized;
  daily_pnl_ += realized;
  return pos;
}

}  // namespace tradecore
