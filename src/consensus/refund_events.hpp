#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace refundledger::consensus {

enum class LedgerEventType : std::uint8_t {
  kBatchesChanged = 0,
  kBalanceIncreased = 1,
  kBalanceDecreased = 2,
  kBatchesRemoved = 3,
  kRefunded = 4,
  kBalanceWithdrawn = 5,
};

const char* LedgerEventName(LedgerEventType type);

// One notification per committed operation. Fields that do not apply to a
// given type are left empty:
//   kBatchesChanged    refunder, roots, amounts
//   kBalanceIncreased  refunder, amount
//   kBalanceDecreased  refunder, amount
//   kBatchesRemoved    refunder, roots, amounts, amount (prior balance)
//   kRefunded          refunder, recipient, amount
//   kBalanceWithdrawn  refunder, amount (prior balance)
struct LedgerEvent {
  LedgerEventType type{LedgerEventType::kBatchesChanged};
  primitives::Address refunder{};
  primitives::Address recipient{};
  std::vector<primitives::Hash256> roots;
  std::vector<primitives::Amount> amounts;
  primitives::Amount amount{};
};

class EventSink {
 public:
  virtual ~EventSink() = default;
  virtual void OnEvent(const LedgerEvent& event) = 0;
};

// Keeps every delivered event in memory, in delivery order.
class RecordingEventSink : public EventSink {
 public:
  void OnEvent(const LedgerEvent& event) override { events_.push_back(event); }

  const std::vector<LedgerEvent>& Events() const noexcept { return events_; }
  std::size_t Size() const noexcept { return events_.size(); }
  void Clear() { events_.clear(); }

 private:
  std::vector<LedgerEvent> events_;
};

}  // namespace refundledger::consensus
