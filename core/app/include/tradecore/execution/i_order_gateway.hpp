#pragma once

#include "tradecore/domain/order.hpp"
#include "tradecore/domain/order_status.hpp"
#include "tradecore/time/time_utils.hpp"

#include <functional>
#include <future>
#include <string>
#include <utility>

namespace tradecore {

// -----------------------------------------------------------------------------
// GatewayAck: venue response to a submit or cancel request
// -----------------------------------------------------------------------------
struct GatewayAck {
  bool accepted{false};
  std::string message;  // Rejection reason; empty on success

  static GatewayAck ok() { return GatewayAck{true, {}}; }
  static GatewayAck fail(std::string message) {
    return GatewayAck{false, std::move(message)};
  }
};

// -----------------------------------------------------------------------------
// ExecutionReport: asynchronous outcome of an accepted order
// -----------------------------------------------------------------------------
// status is always terminal (Filled, Cancelled or Rejected).
// -----------------------------------------------------------------------------
struct ExecutionReport {
  domain::OrderId order_id{};
  domain::OrderStatus status{domain::OrderStatus::Filled};
  double filled_quantity{0.0};
  double fill_price{0.0};
  Timestamp timestamp{};
  std::string message;
};

// -----------------------------------------------------------------------------
// IOrderGateway: order routing capability
// -----------------------------------------------------------------------------
//
// @brief  Asynchronous submit/cancel against an external venue, plus a
//         callback channel for execution reports.
//
// @details
// submitOrder() and cancelOrder() return immediately with a future that the
// implementation fulfils once the venue answers. The OrderCoordinator waits
// on that future with its own timeout, so a slow or dead venue shows up as a
// failed submission rather than a stuck decision loop.
//
// Implementations must return promise-backed futures. A future obtained from
// std::async blocks in its destructor, which would defeat the timeout.
// A future may also carry an exception; callers treat that as a failure.
//
// Execution reports are delivered on an implementation-owned thread through
// the handler installed with setExecutionReportHandler(). Installing an
// empty handler detaches the current one; implementations guarantee the old
// handler is not running once the call returns.
// -----------------------------------------------------------------------------
class IOrderGateway {
 public:
  using ExecutionReportHandler = std::function<void(const ExecutionReport&)>;

  virtual ~IOrderGateway() = default;

  virtual std::future<GatewayAck> submitOrder(const domain::Order& order) = 0;

  virtual std::future<GatewayAck> cancelOrder(domain::OrderId order_id) = 0;

  virtual void setExecutionReportHandler(ExecutionReportHandler handler) = 0;
};

}  // namespace tradecore
