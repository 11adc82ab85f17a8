#pragma once

#include "qless/domain/order.hpp"
#include "qless/domain/order_status.hpp"

#include <stdexcept>
#include <string>
#include <vector>

namespace qless {

// -----------------------------------------------------------------------------
// OrderError — root of the named failures the order service reports
// -----------------------------------------------------------------------------
//
// @brief  Every failure that reaches an OrderService caller derives from
//         OrderError and carries a stable name().
//
// @details
// The command layer (and any other front end) maps name() to a response
// code without string-matching what(). The set is closed:
//
//   NotFound           referenced order or catalog item does not exist
//   InvalidTransition  requested status not reachable from current status
//   UnavailableItem    a catalog entry is currently switched off
//   EmptyOrder         zero line items (including an empty cart)
//   ConflictError      lost a compare-and-swap race on the status field
//   InvalidRequest     malformed input (blank name, quantity < 1, bad JSON)
//
// Publishing failures are deliberately absent: the QueueBroadcaster logs and
// swallows them, so they never reach a caller.
// -----------------------------------------------------------------------------
class OrderError : public std::runtime_error {
 public:
  explicit OrderError(const std::string& message)
      : std::runtime_error(message) {}

  virtual const char* name() const noexcept = 0;
};

class NotFound final : public OrderError {
 public:
  using OrderError::OrderError;
  const char* name() const noexcept override { return "NotFound"; }
};

class UnavailableItem final : public OrderError {
 public:
  using OrderError::OrderError;
  const char* name() const noexcept override { return "UnavailableItem"; }
};

class EmptyOrder final : public OrderError {
 public:
  using OrderError::OrderError;
  const char* name() const noexcept override { return "EmptyOrder"; }
};

class InvalidRequest final : public OrderError {
 public:
  using OrderError::OrderError;
  const char* name() const noexcept override { return "InvalidRequest"; }
};

// -----------------------------------------------------------------------------
// ConflictError
// -----------------------------------------------------------------------------
// Thrown by IOrderRepository::updateStatus() when the stored status no longer
// matches the caller's expectation. The OrderStateMachine re-reads and
// re-checks a bounded number of times before letting it escape.
// -----------------------------------------------------------------------------
class ConflictError final : public OrderError {
 public:
  ConflictError(domain::OrderId id, domain::OrderStatus expected,
                domain::OrderStatus actual);

  const char* name() const noexcept override { return "ConflictError"; }

  domain::OrderId orderId() const { return id_; }
  domain::OrderStatus expected() const { return expected_; }
  domain::OrderStatus actual() const { return actual_; }

 private:
  domain::OrderId id_;
  domain::OrderStatus expected_;
  domain::OrderStatus actual_;
};

// -----------------------------------------------------------------------------
// InvalidTransition
// -----------------------------------------------------------------------------
// Carries the order's current status and every status it may legally move to
// next (empty once Completed), so the caller can explain the rejection.
// -----------------------------------------------------------------------------
class InvalidTransition final : public OrderError {
 public:
  InvalidTransition(domain::OrderStatus current, domain::OrderStatus requested,
                    std::vector<domain::OrderStatus> allowed);

  const char* name() const noexcept override { return "InvalidTransition"; }

  domain::OrderStatus current() const { return current_; }
  domain::OrderStatus requested() const { return requested_; }
  const std::vector<domain::OrderStatus>& allowed() const { return allowed_; }

 private:
  domain::OrderStatus current_;
  domain::OrderStatus requested_;
  std::vector<domain::OrderStatus> allowed_;
};

}  // namespace qless
