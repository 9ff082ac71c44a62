#include "tradecore/domain/order_status.hpp"

namespace tradecore {
namespace domain {

// -----------------------------------------------------------------------------
// canTransition: walk the lifecycle graph
// -----------------------------------------------------------------------------
bool canTransition(OrderStatus from, OrderStatus to) {
  using S = OrderStatus;

  switch (from) {
    case S::Created:
      return to == S::Submitted ||
             to == S::Rejected;

    case S::Submitted:
      return to == S::Filled ||
             to == S::Cancelled ||
             to == S::Rejected;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
      return false;
  }

  return false;
}

bool isTerminal(OrderStatus status) {
  using S = OrderStatus;
  return status == S::Filled ||
         status == S::Cancelled ||
         status == S::Rejected;
}

const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Created:
      return "Created";
    case OrderStatus::Submitted:
      return "Submitted";
    case OrderStatus::Filled:
      return "Filled";
    case OrderStatus::Cancelled:
      return "Cancelled";
    case OrderStatus::Rejected:
      return "Rejected";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace tradecore
