#include "consensus/refund_events.hpp"

namespace refundledger::consensus {

const char* LedgerEventName(LedgerEventType type) {
  switch (type) {
    case LedgerEventType::kBatchesChanged:
      return "BatchesChanged";
    case LedgerEventType::kBalanceIncreased:
      return "BalanceIncreased";
    case LedgerEventType::kBalanceDecreased:
      return "BalanceDecreased";
    case LedgerEventType::kBatchesRemoved:
      return "BatchesRemoved";
    case LedgerEventType::kRefunded:
      return "Refunded";
    case LedgerEventType::kBalanceWithdrawn:
      return "BalanceWithdrawn";
  }
  return "Unknown";
}

}  // namespace refundledger::consensus
