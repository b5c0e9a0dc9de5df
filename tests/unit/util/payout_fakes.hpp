#pragma once

#include <functional>
#include <string>
#include <vector>

#include "consensus/payout.hpp"
#include "primitives/address.hpp"
#include "primitives/amount.hpp"

namespace refundledger::test {

struct RecordedTransfer {
  primitives::Address recipient{};
  primitives::Amount amount{};
};

// Records accepted transfers. `fail` rejects every transfer; `hook` runs
// before the transfer is recorded and may call back into the ledger.
class FakePayoutChannel : public consensus::PayoutChannel {
 public:
  bool Transfer(const primitives::Address& recipient, const primitives::Amount& amount,
                std::string* error) override {
    ++attempts;
    if (hook && !hook(recipient, amount)) {
      if (error) *error = "hook rejected transfer";
      return false;
    }
    if (fail) {
      if (error) *error = "recipient rejected funds";
      return false;
    }
    transfers.push_back(RecordedTransfer{recipient, amount});
    return true;
  }

  primitives::Amount TotalTo(const primitives::Address& recipient) const {
    primitives::Amount total;
    for (const auto& transfer : transfers) {
      if (transfer.recipient == recipient) {
        if (!primitives::CheckedAdd(total, transfer.amount, &total)) {
          return primitives::Amount::Max();
        }
      }
    }
    return total;
  }

  bool fail{false};
  int attempts{0};
  std::function<bool(const primitives::Address&, const primitives::Amount&)> hook;
  std::vector<RecordedTransfer> transfers;
};

}  // namespace refundledger::test
