#pragma once

#include <stdexcept>
#include <string>

namespace tradecore {

// -----------------------------------------------------------------------------
// InvariantViolation
// -----------------------------------------------------------------------------
//
// @brief  Raised when internal engine state can no longer be trusted (for
//         example a non-finite value in the position ledger).
//
// @details
// Ordinary failures inside a polling loop (a bad tick, a gateway hiccup) are
// logged and the loop moves on to its next poll. An InvariantViolation is the
// one exception type that PollingLoopThread treats as fatal: the loop is
// marked faulted and exits, and the Orchestrator reports it as unhealthy.
// -----------------------------------------------------------------------------
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace tradecore
