#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "consensus/payout.hpp"

namespace refundledger::node {

// Payout channel of the daemon. Accepted transfers are staged as JSON lines
// ({"seq","time","to","amount"}) and only reach the append-only journal that
// an external settlement process consumes once Commit() is called, which the
// daemon does after the ledger snapshot covering them is on disk.
class PayoutJournal : public consensus::PayoutChannel {
 public:
  explicit PayoutJournal(std::string path);

  bool Transfer(const primitives::Address& recipient, const primitives::Amount& amount,
                std::string* error) override;

  // Append every staged entry to the journal. Entries stay staged when the
  // write fails.
  bool Commit(std::string* error = nullptr);
  // Drop staged entries that belong to state which was never persisted.
  void Discard();

  const std::string& Path() const noexcept { return path_; }
  std::size_t Pending() const noexcept { return pending_.size(); }
  // Entries appended by this instance.
  std::uint64_t Appended() const noexcept { return appended_; }

 private:
  std::string path_;
  std::vector<std::string> pending_;
  std::uint64_t appended_{0};
};

}  // namespace refundledger::node
