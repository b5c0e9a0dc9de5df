#include "consensus/refund_state.hpp"

#include <utility>

namespace refundledger::consensus {

const RefundState::Roots* RefundState::GetRoots(const primitives::Address& refunder) const {
  const auto it = roots_.find(refunder);
  if (it == roots_.end()) {
    return nullptr;
  }
  return &it->second;
}

const RefundState::Amounts* RefundState::GetAmounts(const primitives::Address& refunder) const {
  const auto it = amounts_.find(refunder);
  if (it == amounts_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool RefundState::HasBatches(const primitives::Address& refunder) const {
  const auto* roots = GetRoots(refunder);
  return roots != nullptr && !roots->empty();
}

primitives::Amount RefundState::GetBalance(const primitives::Address& refunder) const {
  const auto it = balances_.find(refunder);
  if (it == balances_.end()) {
    return primitives::Amount::Zero();
  }
  return it->second;
}

bool RefundState::IsRefunded(const primitives::Address& refunder,
                             const primitives::Address& recipient) const {
  return refunded_.find(RefundKey{refunder, recipient}) != refunded_.end();
}

bool RefundState::SetBatches(const primitives::Address& refunder, Roots roots, Amounts amounts) {
  if (roots.size() != amounts.size()) {
    return false;
  }

  JournalEntry roots_entry;
  roots_entry.kind = JournalEntry::Kind::kRoots;
  roots_entry.key.refunder = refunder;
  if (auto it = roots_.find(refunder); it != roots_.end()) {
    roots_entry.previous_roots = std::move(it->second);
    roots_.erase(it);
  }
  journal_.push_back(std::move(roots_entry));

  JournalEntry amounts_entry;
  amounts_entry.kind = JournalEntry::Kind::kAmounts;
  amounts_entry.key.refunder = refunder;
  if (auto it = amounts_.find(refunder); it != amounts_.end()) {
    amounts_entry.previous_amounts = std::move(it->second);
    amounts_.erase(it);
  }
  journal_.push_back(std::move(amounts_entry));

  if (!roots.empty()) {
    roots_.emplace(refunder, std::move(roots));
    amounts_.emplace(refunder, std::move(amounts));
  }
  return true;
}

void RefundState::SetBalance(const primitives::Address& refunder,
                             const primitives::Amount& balance) {
  JournalEntry entry;
  entry.kind = JournalEntry::Kind::kBalance;
  entry.key.refunder = refunder;
  if (auto it = balances_.find(refunder); it != balances_.end()) {
    entry.previous_balance = it->second;
  }
  journal_.push_back(std::move(entry));

  if (balance.IsZero()) {
    balances_.erase(refunder);
  } else {
    balances_[refunder] = balance;
  }
}

bool RefundState::MarkRefunded(const primitives::Address& refunder,
                               const primitives::Address& recipient) {
  RefundKey key{refunder, recipient};
  if (!refunded_.insert(key).second) {
    return false;
  }
  JournalEntry entry;
  entry.kind = JournalEntry::Kind::kRefunded;
  entry.key = key;
  journal_.push_back(std::move(entry));
  return true;
}

void RefundState::Undo(const JournalEntry& entry) {
  const auto& refunder = entry.key.refunder;
  switch (entry.kind) {
    case JournalEntry::Kind::kRoots:
      roots_.erase(refunder);
      if (entry.previous_roots) {
        roots_.emplace(refunder, *entry.previous_roots);
      }
      break;
    case JournalEntry::Kind::kAmounts:
      amounts_.erase(refunder);
      if (entry.previous_amounts) {
        amounts_.emplace(refunder, *entry.previous_amounts);
      }
      break;
    case JournalEntry::Kind::kBalance:
      balances_.erase(refunder);
      if (entry.previous_balance) {
        balances_.emplace(refunder, *entry.previous_balance);
      }
      break;
    case JournalEntry::Kind::kRefunded:
      refunded_.erase(entry.key);
      break;
  }
}

void RefundState::Revert(std::size_t snapshot) {
  while (journal_.size() > snapshot) {
    Undo(journal_.back());
    journal_.pop_back();
  }
}

void RefundState::Clear() {
  roots_.clear();
  amounts_.clear();
  balances_.clear();
  refunded_.clear();
  journal_.clear();
}

}  // namespace refundledger::consensus
