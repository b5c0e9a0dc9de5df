#pragma once

#include <string>

#include "primitives/address.hpp"
#include "primitives/amount.hpp"

namespace refundledger::consensus {

// Outbound value transfer performed by the host. The ledger calls it only
// after its own state has been updated, so an implementation may call back
// into the ledger and will observe the post-update state.
class PayoutChannel {
 public:
  virtual ~PayoutChannel() = default;

  // Returns false (with a reason in `error`) when the transfer was rejected;
  // the ledger then rolls the calling operation back.
  virtual bool Transfer(const primitives::Address& recipient, const primitives::Amount& amount,
                        std::string* error) = 0;
};

}  // namespace refundledger::consensus
