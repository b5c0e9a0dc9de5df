#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "consensus/refund_events.hpp"
#include "consensus/refund_ledger.hpp"
#include "nlohmann/json.hpp"
#include "node/event_log.hpp"
#include "node/payout_journal.hpp"
#include "tests/unit/util/merkle_builder.hpp"
#include "util/logging.hpp"

int main() {
  try {
    using namespace refundledger;
    using primitives::Amount;

    std::filesystem::create_directories("testdata");
    const std::filesystem::path journal_path = "testdata/payouts.jsonl";
    const std::filesystem::path log_path = "testdata/payout-journal-tests.log";
    std::filesystem::remove(journal_path);
    std::filesystem::remove(log_path);

    util::ConfigureLogging(util::LogLevel::kDebug, 0, 0);
    util::EnableFileLogging(log_path.string());

    const auto alice = test::MakeAddress(0xA1);
    const auto funder = test::MakeAddress(0xF0);
    const test::MerkleBuilder tree({alice});

    node::PayoutJournal journal(journal_path.string());
    node::LoggingEventSink events;
    consensus::RefundLedger ledger(&journal, &events);

    if (!ledger.SetBatches(funder, {tree.Root()}, {Amount(70)}, Amount(100)).ok ||
        !ledger.Refund(alice, funder, tree.Proof(0)).ok || !ledger.Withdraw(funder).ok) {
      std::cerr << "ledger operations failed\n";
      return EXIT_FAILURE;
    }
    if (journal.Pending() != 2 || journal.Appended() != 0 || events.Delivered() != 3) {
      std::cerr << "unexpected journal/event counts\n";
      return EXIT_FAILURE;
    }
    if (std::filesystem::exists(journal_path)) {
      std::cerr << "staged payouts reached the journal before commit\n";
      return EXIT_FAILURE;
    }
    std::string commit_error;
    if (!journal.Commit(&commit_error) || journal.Pending() != 0 || journal.Appended() != 2) {
      std::cerr << "journal commit failed: " << commit_error << "\n";
      return EXIT_FAILURE;
    }

    std::ifstream in(journal_path);
    std::vector<nlohmann::json> lines;
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(nlohmann::json::parse(line));
    }
    if (lines.size() != 2) {
      std::cerr << "expected 2 journal lines, got " << lines.size() << "\n";
      return EXIT_FAILURE;
    }
    if (lines[0]["seq"] != 1 || lines[0]["to"] != primitives::AddressToHex(alice) ||
        lines[0]["amount"] != "70" || lines[1]["seq"] != 2 ||
        lines[1]["to"] != primitives::AddressToHex(funder) || lines[1]["amount"] != "30") {
      std::cerr << "unexpected journal contents\n";
      return EXIT_FAILURE;
    }

    // Committed events reached the log.
    util::DisableFileLogging();
    std::ifstream log_in(log_path);
    const std::string log_text((std::istreambuf_iterator<char>(log_in)),
                               std::istreambuf_iterator<char>());
    if (log_text.find("\"event\":\"Refunded\"") == std::string::npos ||
        log_text.find("[event]") == std::string::npos) {
      std::cerr << "refund event missing from log\n";
      return EXIT_FAILURE;
    }

    // An unwritable journal rejects the transfer and the ledger rolls back.
    std::filesystem::create_directories("testdata/journal-as-dir");
    node::PayoutJournal broken("testdata/journal-as-dir");
    consensus::RefundLedger fragile(&broken, nullptr);
    if (!fragile.SetBatches(funder, {tree.Root()}, {Amount(70)}, Amount(100)).ok) {
      std::cerr << "setbatches failed\n";
      return EXIT_FAILURE;
    }
    const auto failed = fragile.Refund(alice, funder, tree.Proof(0));
    if (failed.ok || failed.code != consensus::LedgerError::kTransferFailed ||
        fragile.BalanceOf(funder) != Amount(100) || fragile.IsRefunded(funder, alice)) {
      std::cerr << "unwritable journal did not roll back the refund\n";
      return EXIT_FAILURE;
    }

    // Discarded entries never reach the journal and do not consume a seq.
    if (!ledger.IncreaseBalance(funder, Amount(9)).ok || !ledger.Withdraw(funder).ok ||
        journal.Pending() != 1) {
      std::cerr << "withdraw did not stage a payout\n";
      return EXIT_FAILURE;
    }
    journal.Discard();
    if (!ledger.IncreaseBalance(funder, Amount(4)).ok || !ledger.Withdraw(funder).ok ||
        !journal.Commit(&commit_error)) {
      std::cerr << "second withdraw failed: " << commit_error << "\n";
      return EXIT_FAILURE;
    }
    std::ifstream again(journal_path);
    std::vector<nlohmann::json> all;
    while (std::getline(again, line)) {
      all.push_back(nlohmann::json::parse(line));
    }
    if (all.size() != 3 || all[2]["seq"] != 3 || all[2]["amount"] != "4") {
      std::cerr << "discarded payout leaked into the journal\n";
      return EXIT_FAILURE;
    }

    std::filesystem::remove(journal_path);
    std::filesystem::remove(log_path);
    std::filesystem::remove("testdata/journal-as-dir");
  } catch (const std::exception& ex) {
    std::cerr << "payout_journal_tests exception: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
