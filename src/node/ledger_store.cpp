#include "node/ledger_store.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

#include "storage/ledger_snapshot.hpp"
#include "util/logging.hpp"

namespace refundledger::node {

LedgerStore::LedgerStore(std::string snapshot_path, PayoutJournal* journal)
    : snapshot_path_(std::move(snapshot_path)),
      journal_(journal),
      snapshot_saver_(&storage::SaveLedgerSnapshot) {}

void LedgerStore::SetSnapshotSaverForTest(SnapshotSaverFn saver) {
  snapshot_saver_ = saver ? saver : &storage::SaveLedgerSnapshot;
}

bool LedgerStore::Load(consensus::RefundLedger* ledger, std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(snapshot_path_, ec)) {
    util::LogInfo("store", "no snapshot at " + snapshot_path_ + ", starting empty");
    return true;
  }
  consensus::RefundState state;
  std::string load_error;
  if (!storage::LoadLedgerSnapshot(&state, snapshot_path_, &load_error)) {
    if (error) *error = "failed to load snapshot " + snapshot_path_ + ": " + load_error;
    return false;
  }
  if (!ledger->ReplaceState(std::move(state))) {
    if (error) *error = "ledger busy while installing snapshot";
    return false;
  }
  util::LogInfo("store", "loaded snapshot: batch_sets=" +
                             std::to_string(ledger->State().BatchSetCount()) +
                             ", balances=" + std::to_string(ledger->State().BalanceCount()) +
                             ", refunds=" + std::to_string(ledger->State().RefundCount()));
  return true;
}

bool LedgerStore::PersistCommitted(const consensus::RefundLedger& ledger, std::string* error) {
  std::string save_error;
  if (!snapshot_saver_(ledger.State(), snapshot_path_, &save_error)) {
    ++save_failures_;
    if (journal_) {
      journal_->Discard();
    }
    if (error) *error = "failed to save snapshot " + snapshot_path_ + ": " + save_error;
    return false;
  }
  if (journal_ && !journal_->Commit(error)) {
    return false;
  }
  return true;
}

void LedgerStore::DropUncommitted() {
  if (journal_) {
    journal_->Discard();
  }
}

}  // namespace refundledger::node
