#pragma once

#include <cstdint>
#include <string>

#include "consensus/refund_ledger.hpp"
#include "consensus/refund_state.hpp"
#include "node/payout_journal.hpp"

namespace refundledger::node {

// Ties the ledger snapshot to the payout journal. A committed request is
// made durable snapshot first: staged payouts are released to the journal
// only after the snapshot that records their claims and balance changes has
// been written, so a restart can never replay a payout the journal already
// holds.
class LedgerStore {
 public:
  using SnapshotSaverFn = bool (*)(const consensus::RefundState& state, const std::string& path,
                                   std::string* error);

  LedgerStore(std::string snapshot_path, PayoutJournal* journal);

  void SetSnapshotSaverForTest(SnapshotSaverFn saver);

  // Install the snapshot at the configured path. A missing file leaves the
  // ledger empty and succeeds.
  bool Load(consensus::RefundLedger* ledger, std::string* error);

  // Persist the state of a request that committed. On a failed save the
  // staged payouts are dropped and false is returned; the in-memory ledger
  // is then ahead of the disk and must not keep serving.
  bool PersistCommitted(const consensus::RefundLedger& ledger, std::string* error);

  // Forget staged payouts of a request that did not commit.
  void DropUncommitted();

  const std::string& SnapshotPath() const noexcept { return snapshot_path_; }
  std::uint64_t SaveFailures() const noexcept { return save_failures_; }

 private:
  std::string snapshot_path_;
  PayoutJournal* journal_{nullptr};
  SnapshotSaverFn snapshot_saver_{nullptr};
  std::uint64_t save_failures_{0};
};

}  // namespace refundledger::node
