#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "consensus/payout.hpp"
#include "consensus/refund_events.hpp"
#include "consensus/refund_state.hpp"
#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace refundledger::consensus {

enum class LedgerError : std::uint8_t {
  kNone = 0,
  kLengthMismatch,
  kNoBatches,
  kInsufficientBalance,
  kInsufficientFunderBalance,
  kNotRefundable,
  kNothingToWithdraw,
  kTransferFailed,
  kAmountOverflow,
  kReentrantPayout,
};

const char* LedgerErrorName(LedgerError error);

struct LedgerResult {
  bool ok{false};
  LedgerError code{LedgerError::kNone};
  std::string error;
  // Value credited to (funding) or paid out of (withdrawals, refunds) the
  // refunder balance touched by the operation.
  primitives::Amount amount{};
  // Batch that paid a successful refund.
  std::optional<std::size_t> batch_index;
};

struct LedgerTelemetry {
  std::uint64_t committed_operations{0};
  std::uint64_t failed_operations{0};
  std::uint64_t refunds_paid{0};
  std::uint64_t payout_failures{0};
};

// Refund accounting core. Every mutating operation is all-or-nothing: on
// failure all state changes and pending events of that operation (including
// those of reentrant calls made from the payout channel) are rolled back.
// Events reach the sink only when the outermost operation commits.
//
// Only the outermost operation may move value out: a nested operation that
// would pay fails with kReentrantPayout, since a payout already handed to the
// channel could not be taken back if the outer operation later fails.
//
// The ledger is not internally synchronized; callers provide a serial
// schedule.
class RefundLedger {
 public:
  // Neither pointer is owned. A null sink drops events; a null payout
  // channel makes every nonzero payout fail with kTransferFailed.
  RefundLedger(PayoutChannel* payouts, EventSink* events);
  RefundLedger(const RefundLedger&) = delete;
  RefundLedger& operator=(const RefundLedger&) = delete;

  // Replace the caller's batches and credit `incoming_funds` to its balance.
  LedgerResult SetBatches(const primitives::Address& caller,
                          std::vector<primitives::Hash256> roots,
                          std::vector<primitives::Amount> amounts,
                          const primitives::Amount& incoming_funds);
  // Requires at least one registered batch.
  LedgerResult IncreaseBalance(const primitives::Address& caller,
                               const primitives::Amount& amount);
  // Reduce the balance by exactly `amount` and pay exactly `amount`.
  LedgerResult WithdrawAmount(const primitives::Address& caller,
                              const primitives::Amount& amount);
  // Pay out the whole balance.
  LedgerResult Withdraw(const primitives::Address& caller);
  // Drop all batches and pay out any remaining balance. Claim records stay.
  LedgerResult RemoveBatches(const primitives::Address& caller);
  // Claim the caller's refund from `refunder` using an inclusion proof.
  LedgerResult Refund(const primitives::Address& caller, const primitives::Address& refunder,
                      std::span<const primitives::Hash256> proof);

  std::vector<primitives::Hash256> Roots(const primitives::Address& refunder) const;
  std::vector<primitives::Amount> Amounts(const primitives::Address& refunder) const;
  primitives::Amount BalanceOf(const primitives::Address& refunder) const;
  bool IsRefunded(const primitives::Address& refunder,
                  const primitives::Address& recipient) const;
  // First batch index whose root accepts `proof` for `recipient`, provided
  // the recipient has not claimed from `refunder` yet.
  std::optional<std::size_t> FindRefundableBatch(const primitives::Address& refunder,
                                                 const primitives::Address& recipient,
                                                 std::span<const primitives::Hash256> proof) const;

  const RefundState& State() const noexcept { return state_; }
  // Install a freshly loaded state. Refused while an operation is running.
  bool ReplaceState(RefundState state);

  LedgerTelemetry GetTelemetry() const noexcept { return telemetry_; }
  std::size_t Depth() const noexcept { return depth_; }

 private:
  class OperationScope;

  LedgerError Pay(const primitives::Address& recipient, const primitives::Amount& amount,
                  std::string* error);
  void Emit(LedgerEvent event);
  void FlushEvents();

  RefundState state_;
  PayoutChannel* payouts_{nullptr};
  EventSink* events_{nullptr};
  std::vector<LedgerEvent> pending_events_;
  std::size_t depth_{0};
  LedgerTelemetry telemetry_;
};

}  // namespace refundledger::consensus
