#include "consensus/refund_ledger.hpp"

#include <utility>

#include "consensus/merkle_proof.hpp"
#include "util/logging.hpp"

namespace refundledger::consensus {

namespace {

constexpr std::string_view kLogTag = "ledger";

}  // namespace

const char* LedgerErrorName(LedgerError error) {
  switch (error) {
    case LedgerError::kNone:
      return "None";
    case LedgerError::kLengthMismatch:
      return "LengthMismatch";
    case LedgerError::kNoBatches:
      return "NoBatches";
    case LedgerError::kInsufficientBalance:
      return "InsufficientBalance";
    case LedgerError::kInsufficientFunderBalance:
      return "InsufficientFunderBalance";
    case LedgerError::kNotRefundable:
      return "NotRefundable";
    case LedgerError::kNothingToWithdraw:
      return "NothingToWithdraw";
    case LedgerError::kTransferFailed:
      return "TransferFailed";
    case LedgerError::kAmountOverflow:
      return "AmountOverflow";
    case LedgerError::kReentrantPayout:
      return "ReentrantPayout";
  }
  return "Unknown";
}

// Brackets one operation: records the journal and event marks on entry and
// either commits or rolls back to them. An operation left without an
// explicit outcome (for example when the payout channel throws) is rolled
// back on destruction.
class RefundLedger::OperationScope {
 public:
  OperationScope(RefundLedger* ledger, const char* name, const primitives::Address& caller)
      : ledger_(ledger),
        name_(name),
        caller_(caller),
        state_mark_(ledger->state_.Snapshot()),
        event_mark_(ledger->pending_events_.size()) {
    ++ledger_->depth_;
  }

  OperationScope(const OperationScope&) = delete;
  OperationScope& operator=(const OperationScope&) = delete;

  ~OperationScope() {
    if (!finished_) {
      Rollback();
      --ledger_->depth_;
    }
  }

  LedgerResult Commit(LedgerResult result) {
    finished_ = true;
    result.ok = true;
    result.code = LedgerError::kNone;
    ++ledger_->telemetry_.committed_operations;
    util::LogDebug(kLogTag, std::string(name_) + " ok caller=" +
                                primitives::AddressToHex(caller_) +
                                " amount=" + result.amount.ToString());
    if (--ledger_->depth_ == 0) {
      ledger_->state_.DiscardJournal();
      ledger_->FlushEvents();
    }
    return result;
  }

  LedgerResult Fail(LedgerError code, std::string message) {
    finished_ = true;
    Rollback();
    --ledger_->depth_;
    ++ledger_->telemetry_.failed_operations;
    util::LogDebug(kLogTag, std::string(name_) + " failed caller=" +
                                primitives::AddressToHex(caller_) + " " +
                                LedgerErrorName(code) + ": " + message);
    LedgerResult result;
    result.ok = false;
    result.code = code;
    result.error = std::move(message);
    return result;
  }

 private:
  void Rollback() {
    ledger_->state_.Revert(state_mark_);
    ledger_->pending_events_.resize(event_mark_);
  }

  RefundLedger* ledger_;
  const char* name_;
  primitives::Address caller_;
  std::size_t state_mark_;
  std::size_t event_mark_;
  bool finished_{false};
};

RefundLedger::RefundLedger(PayoutChannel* payouts, EventSink* events)
    : payouts_(payouts), events_(events) {}

LedgerResult RefundLedger::SetBatches(const primitives::Address& caller,
                                      std::vector<primitives::Hash256> roots,
                                      std::vector<primitives::Amount> amounts,
                                      const primitives::Amount& incoming_funds) {
  OperationScope scope(this, "setbatches", caller);
  if (roots.size() != amounts.size()) {
    return scope.Fail(LedgerError::kLengthMismatch,
                      "roots/amounts length mismatch (" + std::to_string(roots.size()) +
                          " vs " + std::to_string(amounts.size()) + ")");
  }
  if (!incoming_funds.IsZero()) {
    primitives::Amount updated;
    if (!primitives::CheckedAdd(state_.GetBalance(caller), incoming_funds, &updated)) {
      return scope.Fail(LedgerError::kAmountOverflow, "balance overflow");
    }
    state_.SetBalance(caller, updated);
  }

  LedgerEvent event;
  event.type = LedgerEventType::kBatchesChanged;
  event.refunder = caller;
  event.roots = roots;
  event.amounts = amounts;
  state_.SetBatches(caller, std::move(roots), std::move(amounts));
  Emit(std::move(event));

  LedgerResult result;
  result.amount = incoming_funds;
  return scope.Commit(std::move(result));
}

LedgerResult RefundLedger::IncreaseBalance(const primitives::Address& caller,
                                           const primitives::Amount& amount) {
  OperationScope scope(this, "increasebalance", caller);
  if (!state_.HasBatches(caller)) {
    return scope.Fail(LedgerError::kNoBatches, "no batches registered");
  }
  primitives::Amount updated;
  if (!primitives::CheckedAdd(state_.GetBalance(caller), amount, &updated)) {
    return scope.Fail(LedgerError::kAmountOverflow, "balance overflow");
  }
  state_.SetBalance(caller, updated);

  LedgerEvent event;
  event.type = LedgerEventType::kBalanceIncreased;
  event.refunder = caller;
  event.amount = amount;
  Emit(std::move(event));

  LedgerResult result;
  result.amount = amount;
  return scope.Commit(std::move(result));
}

LedgerResult RefundLedger::WithdrawAmount(const primitives::Address& caller,
                                          const primitives::Amount& amount) {
  OperationScope scope(this, "withdrawamount", caller);
  const primitives::Amount balance = state_.GetBalance(caller);
  primitives::Amount remaining;
  if (!primitives::CheckedSub(balance, amount, &remaining)) {
    return scope.Fail(LedgerError::kInsufficientBalance,
                      "requested " + amount.ToString() + " exceeds balance " +
                          balance.ToString());
  }
  state_.SetBalance(caller, remaining);

  std::string transfer_error;
  if (const auto code = Pay(caller, amount, &transfer_error);
      code != LedgerError::kNone) {
    return scope.Fail(code, transfer_error);
  }

  LedgerEvent event;
  event.type = LedgerEventType::kBalanceDecreased;
  event.refunder = caller;
  event.amount = amount;
  Emit(std::move(event));

  LedgerResult result;
  result.amount = amount;
  return scope.Commit(std::move(result));
}

LedgerResult RefundLedger::Withdraw(const primitives::Address& caller) {
  OperationScope scope(this, "withdraw", caller);
  const primitives::Amount balance = state_.GetBalance(caller);
  if (balance.IsZero()) {
    return scope.Fail(LedgerError::kNothingToWithdraw, "balance is zero");
  }
  state_.SetBalance(caller, primitives::Amount::Zero());

  std::string transfer_error;
  if (const auto code = Pay(caller, balance, &transfer_error);
      code != LedgerError::kNone) {
    return scope.Fail(code, transfer_error);
  }

  LedgerEvent event;
  event.type = LedgerEventType::kBalanceWithdrawn;
  event.refunder = caller;
  event.amount = balance;
  Emit(std::move(event));

  LedgerResult result;
  result.amount = balance;
  return scope.Commit(std::move(result));
}

LedgerResult RefundLedger::RemoveBatches(const primitives::Address& caller) {
  OperationScope scope(this, "removebatches", caller);
  LedgerEvent event;
  event.type = LedgerEventType::kBatchesRemoved;
  event.refunder = caller;
  event.roots = Roots(caller);
  event.amounts = Amounts(caller);
  event.amount = state_.GetBalance(caller);

  state_.SetBatches(caller, {}, {});
  if (!event.amount.IsZero()) {
    state_.SetBalance(caller, primitives::Amount::Zero());
    std::string transfer_error;
    if (const auto code = Pay(caller, event.amount, &transfer_error);
        code != LedgerError::kNone) {
      return scope.Fail(code, transfer_error);
    }
  }

  LedgerResult result;
  result.amount = event.amount;
  Emit(std::move(event));
  return scope.Commit(std::move(result));
}

LedgerResult RefundLedger::Refund(const primitives::Address& caller,
                                  const primitives::Address& refunder,
                                  std::span<const primitives::Hash256> proof) {
  OperationScope scope(this, "refund", caller);
  const auto index = FindRefundableBatch(refunder, caller, proof);
  if (!index) {
    return scope.Fail(LedgerError::kNotRefundable,
                      "no unclaimed batch of " + primitives::AddressToHex(refunder) +
                          " accepts the proof");
  }
  const primitives::Amount owed = (*state_.GetAmounts(refunder))[*index];
  const primitives::Amount balance = state_.GetBalance(refunder);
  primitives::Amount remaining;
  if (!primitives::CheckedSub(balance, owed, &remaining)) {
    return scope.Fail(LedgerError::kInsufficientFunderBalance,
                      "batch " + std::to_string(*index) + " owes " + owed.ToString() +
                          " but refunder balance is " + balance.ToString());
  }

  // Effects first: a reentrant call from the payout channel must already see
  // the claim and the reduced balance.
  state_.MarkRefunded(refunder, caller);
  state_.SetBalance(refunder, remaining);

  std::string transfer_error;
  if (const auto code = Pay(caller, owed, &transfer_error);
      code != LedgerError::kNone) {
    return scope.Fail(code, transfer_error);
  }
  ++telemetry_.refunds_paid;

  LedgerEvent event;
  event.type = LedgerEventType::kRefunded;
  event.refunder = refunder;
  event.recipient = caller;
  event.amount = owed;
  Emit(std::move(event));

  LedgerResult result;
  result.amount = owed;
  result.batch_index = *index;
  return scope.Commit(std::move(result));
}

std::vector<primitives::Hash256> RefundLedger::Roots(const primitives::Address& refunder) const {
  const auto* roots = state_.GetRoots(refunder);
  if (!roots) {
    return {};
  }
  return *roots;
}

std::vector<primitives::Amount> RefundLedger::Amounts(const primitives::Address& refunder) const {
  const auto* amounts = state_.GetAmounts(refunder);
  if (!amounts) {
    return {};
  }
  return *amounts;
}

primitives::Amount RefundLedger::BalanceOf(const primitives::Address& refunder) const {
  return state_.GetBalance(refunder);
}

bool RefundLedger::IsRefunded(const primitives::Address& refunder,
                              const primitives::Address& recipient) const {
  return state_.IsRefunded(refunder, recipient);
}

std::optional<std::size_t> RefundLedger::FindRefundableBatch(
    const primitives::Address& refunder, const primitives::Address& recipient,
    std::span<const primitives::Hash256> proof) const {
  if (state_.IsRefunded(refunder, recipient)) {
    return std::nullopt;
  }
  const auto* roots = state_.GetRoots(refunder);
  if (!roots) {
    return std::nullopt;
  }
  const primitives::Hash256 leaf = LeafHash(recipient);
  for (std::size_t i = 0; i < roots->size(); ++i) {
    if (VerifyMerkleProof((*roots)[i], proof, leaf)) {
      return i;
    }
  }
  return std::nullopt;
}

bool RefundLedger::ReplaceState(RefundState state) {
  if (depth_ != 0) {
    return false;
  }
  state_ = std::move(state);
  state_.DiscardJournal();
  pending_events_.clear();
  return true;
}

LedgerError RefundLedger::Pay(const primitives::Address& recipient,
                              const primitives::Amount& amount, std::string* error) {
  if (amount.IsZero()) {
    return LedgerError::kNone;
  }
  if (depth_ > 1) {
    if (error) *error = "payout refused inside a nested operation";
    return LedgerError::kReentrantPayout;
  }
  if (!payouts_) {
    if (error) *error = "no payout channel configured";
    ++telemetry_.payout_failures;
    return LedgerError::kTransferFailed;
  }
  std::string reason;
  if (!payouts_->Transfer(recipient, amount, &reason)) {
    ++telemetry_.payout_failures;
    if (reason.empty()) {
      reason = "transfer rejected";
    }
    util::LogWarn(kLogTag, "payout of " + amount.ToString() + " to " +
                               primitives::AddressToHex(recipient) + " failed: " + reason);
    if (error) *error = std::move(reason);
    return LedgerError::kTransferFailed;
  }
  return LedgerError::kNone;
}

void RefundLedger::Emit(LedgerEvent event) { pending_events_.push_back(std::move(event)); }

void RefundLedger::FlushEvents() {
  std::vector<LedgerEvent> ready;
  ready.swap(pending_events_);
  if (!events_) {
    return;
  }
  for (const auto& event : ready) {
    events_->OnEvent(event);
  }
}

}  // namespace refundledger::consensus
