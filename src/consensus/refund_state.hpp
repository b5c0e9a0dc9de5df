#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace refundledger::consensus {

struct RefundKey {
  primitives::Address refunder{};
  primitives::Address recipient{};
  bool operator==(const RefundKey& other) const = default;
};

struct RefundKeyHasher {
  std::size_t operator()(const RefundKey& key) const noexcept {
    std::size_t result = primitives::AddressHasher{}(key.refunder);
    result ^= primitives::AddressHasher{}(key.recipient) + 0x9e3779b97f4a7c15ULL +
              (result << 6) + (result >> 2);
    return result;
  }
};

// The four keyed stores behind the ledger: batch roots, batch amounts,
// balances and claim records. Every mutation appends an undo record so a
// failed operation can be rolled back to a Snapshot() mark, including the
// effects of nested operations that committed after the mark.
class RefundState {
 public:
  using Roots = std::vector<primitives::Hash256>;
  using Amounts = std::vector<primitives::Amount>;

  // nullptr when the refunder has no registered batches.
  const Roots* GetRoots(const primitives::Address& refunder) const;
  const Amounts* GetAmounts(const primitives::Address& refunder) const;
  bool HasBatches(const primitives::Address& refunder) const;
  primitives::Amount GetBalance(const primitives::Address& refunder) const;
  bool IsRefunded(const primitives::Address& refunder,
                  const primitives::Address& recipient) const;

  // Replaces the refunder's batch set. Empty vectors remove it. Returns false
  // (and changes nothing) when the lengths differ.
  bool SetBatches(const primitives::Address& refunder, Roots roots, Amounts amounts);
  // A zero balance removes the entry.
  void SetBalance(const primitives::Address& refunder, const primitives::Amount& balance);
  // Returns false when the pair was already recorded.
  bool MarkRefunded(const primitives::Address& refunder, const primitives::Address& recipient);

  std::size_t Snapshot() const noexcept { return journal_.size(); }
  void Revert(std::size_t snapshot);
  // Forget undo history once the outermost operation has committed.
  void DiscardJournal() { journal_.clear(); }
  std::size_t JournalSize() const noexcept { return journal_.size(); }

  std::size_t BatchSetCount() const noexcept { return roots_.size(); }
  std::size_t BalanceCount() const noexcept { return balances_.size(); }
  std::size_t RefundCount() const noexcept { return refunded_.size(); }

  template <typename Fn>
  void ForEachBatchSet(Fn&& fn) const {
    for (const auto& [refunder, roots] : roots_) {
      const auto it = amounts_.find(refunder);
      if (it == amounts_.end()) continue;
      if (!fn(refunder, roots, it->second)) break;
    }
  }

  template <typename Fn>
  void ForEachBalance(Fn&& fn) const {
    for (const auto& [refunder, balance] : balances_) {
      if (!fn(refunder, balance)) break;
    }
  }

  template <typename Fn>
  void ForEachRefund(Fn&& fn) const {
    for (const auto& key : refunded_) {
      if (!fn(key)) break;
    }
  }

  void Clear();

 private:
  struct JournalEntry {
    enum class Kind : std::uint8_t { kRoots, kAmounts, kBalance, kRefunded };
    Kind kind{Kind::kRoots};
    RefundKey key{};  // recipient only meaningful for kRefunded
    std::optional<Roots> previous_roots;
    std::optional<Amounts> previous_amounts;
    std::optional<primitives::Amount> previous_balance;
  };

  void Undo(const JournalEntry& entry);

  std::unordered_map<primitives::Address, Roots, primitives::AddressHasher> roots_;
  std::unordered_map<primitives::Address, Amounts, primitives::AddressHasher> amounts_;
  std::unordered_map<primitives::Address, primitives::Amount, primitives::AddressHasher>
      balances_;
  std::unordered_set<RefundKey, RefundKeyHasher> refunded_;
  std::vector<JournalEntry> journal_;
};

}  // namespace refundledger::consensus
