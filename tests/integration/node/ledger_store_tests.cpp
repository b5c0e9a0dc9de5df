#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "config/ledger_config.hpp"
#include "consensus/refund_ledger.hpp"
#include "consensus/refund_state.hpp"
#include "nlohmann/json.hpp"
#include "node/ledger_store.hpp"
#include "node/payout_journal.hpp"
#include "tests/unit/util/merkle_builder.hpp"

using namespace refundledger;

namespace {

bool AlwaysFailSave(const consensus::RefundState&, const std::string&, std::string* error) {
  if (error) *error = "disk full";
  return false;
}

std::vector<nlohmann::json> ReadJournal(const std::filesystem::path& path) {
  std::vector<nlohmann::json> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line)) {
    lines.push_back(nlohmann::json::parse(line));
  }
  return lines;
}

bool RunSaveFailureTest() {
  using primitives::Amount;
  config::SelectNetwork(config::LedgerNetwork::kRegtest);

  const std::filesystem::path root = "testdata/ledger-store";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  const std::string snapshot_path = (root / "ledger.dat").string();
  const std::filesystem::path journal_path = root / "payouts.jsonl";

  const auto alice = test::MakeAddress(0xA1);
  const auto bob = test::MakeAddress(0xB2);
  const auto funder = test::MakeAddress(0xF0);
  const test::MerkleBuilder tree({alice, bob});

  {
    node::PayoutJournal journal(journal_path.string());
    consensus::RefundLedger ledger(&journal, nullptr);
    node::LedgerStore store(snapshot_path, &journal);
    std::string error;
    if (!store.Load(&ledger, &error)) {
      std::cerr << "ledger_store_tests: empty load failed: " << error << "\n";
      return false;
    }
    if (!ledger.SetBatches(funder, {tree.Root()}, {Amount(40)}, Amount(100)).ok ||
        !store.PersistCommitted(ledger, &error)) {
      std::cerr << "ledger_store_tests: initial persist failed: " << error << "\n";
      return false;
    }

    // The refund commits in memory but its snapshot cannot be written.
    store.SetSnapshotSaverForTest(&AlwaysFailSave);
    if (!ledger.Refund(alice, funder, tree.Proof(0)).ok || journal.Pending() != 1) {
      std::cerr << "ledger_store_tests: refund did not stage a payout\n";
      return false;
    }
    if (store.PersistCommitted(ledger, &error)) {
      std::cerr << "ledger_store_tests: expected persist to fail\n";
      return false;
    }
    if (store.SaveFailures() != 1 || journal.Pending() != 0 || journal.Appended() != 0) {
      std::cerr << "ledger_store_tests: staged payout survived the failed save\n";
      return false;
    }
    if (!ReadJournal(journal_path).empty()) {
      std::cerr << "ledger_store_tests: journal recorded an unpersisted payout\n";
      return false;
    }
  }

  // Restart: the disk never saw the claim, and the journal never saw the
  // payout, so the claim is still open and is paid exactly once.
  {
    node::PayoutJournal journal(journal_path.string());
    consensus::RefundLedger ledger(&journal, nullptr);
    node::LedgerStore store(snapshot_path, &journal);
    std::string error;
    if (!store.Load(&ledger, &error)) {
      std::cerr << "ledger_store_tests: reload failed: " << error << "\n";
      return false;
    }
    if (ledger.IsRefunded(funder, alice) || ledger.BalanceOf(funder) != Amount(100)) {
      std::cerr << "ledger_store_tests: reloaded state does not match the last save\n";
      return false;
    }
    if (!ledger.Refund(alice, funder, tree.Proof(0)).ok ||
        !store.PersistCommitted(ledger, &error)) {
      std::cerr << "ledger_store_tests: refund after restart failed: " << error << "\n";
      return false;
    }

    // A request that does not commit leaves nothing staged.
    if (!ledger.Withdraw(funder).ok || journal.Pending() != 1) {
      std::cerr << "ledger_store_tests: withdraw did not stage a payout\n";
      return false;
    }
    store.DropUncommitted();
    if (journal.Pending() != 0) {
      std::cerr << "ledger_store_tests: DropUncommitted kept staged payouts\n";
      return false;
    }
  }

  {
    node::PayoutJournal journal(journal_path.string());
    consensus::RefundLedger ledger(&journal, nullptr);
    node::LedgerStore store(snapshot_path, &journal);
    std::string error;
    if (!store.Load(&ledger, &error)) {
      std::cerr << "ledger_store_tests: second reload failed: " << error << "\n";
      return false;
    }
    if (!ledger.IsRefunded(funder, alice) || ledger.BalanceOf(funder) != Amount(60)) {
      std::cerr << "ledger_store_tests: persisted refund missing after restart\n";
      return false;
    }
    if (ledger.Refund(alice, funder, tree.Proof(0)).code !=
        consensus::LedgerError::kNotRefundable) {
      std::cerr << "ledger_store_tests: claim reopened after restart\n";
      return false;
    }
  }

  const auto lines = ReadJournal(journal_path);
  if (lines.size() != 1 || lines[0]["to"] != primitives::AddressToHex(alice) ||
      lines[0]["amount"] != "40") {
    std::cerr << "ledger_store_tests: expected exactly one payout to alice, got "
              << lines.size() << " line(s)\n";
    return false;
  }

  std::filesystem::remove_all(root);
  return true;
}

bool RunCorruptSnapshotTest() {
  const std::filesystem::path root = "testdata/ledger-store-corrupt";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root);
  const auto snapshot_path = root / "ledger.dat";
  {
    std::ofstream out(snapshot_path, std::ios::binary);
    out << "not a snapshot";
  }
  node::PayoutJournal journal((root / "payouts.jsonl").string());
  consensus::RefundLedger ledger(&journal, nullptr);
  node::LedgerStore store(snapshot_path.string(), &journal);
  std::string error;
  if (store.Load(&ledger, &error) || error.empty()) {
    std::cerr << "ledger_store_tests: corrupt snapshot was accepted\n";
    return false;
  }
  std::filesystem::remove_all(root);
  return true;
}

}  // namespace

int main() {
  try {
    if (!RunSaveFailureTest()) return EXIT_FAILURE;
    if (!RunCorruptSnapshotTest()) return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "ledger_store_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
