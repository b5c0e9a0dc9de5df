#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "config/daemon_options.hpp"
#include "config/ledger_config.hpp"
#include "consensus/refund_ledger.hpp"
#include "nlohmann/json.hpp"
#include "node/event_log.hpp"
#include "node/ledger_store.hpp"
#include "node/payout_journal.hpp"
#include "rpc/ledger_server.hpp"
#include "util/logging.hpp"

using namespace refundledger;

namespace {

void PrintUsage() {
  std::cout << "refundd options:\n"
            << "  --network <net>            mainnet, testnet, regtest (default: mainnet)\n"
            << "  --data-dir <path>          Base data directory (default: ~/.refundd/<network>)\n"
            << "  --snapshot <path>          Ledger snapshot file (default: <data>/ledger.dat)\n"
            << "  --payout-journal <path>    Payout journal (default: <data>/payouts.jsonl)\n"
            << "  --read-only                Reject mutating commands\n"
            << "  --log-file <path>          Append logs to the given file\n"
            << "  --log-level <lvl>          Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>     Rotate the log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>        Number of rotated log files to keep (default: 0)\n"
            << "  --conf <path>              Load options from refundd.conf (default: ./refundd.conf)\n"
            << "  --no-conf                  Disable config file loading\n"
            << "\n"
            << "Reads one JSON-RPC request per line on stdin and writes one response per line.\n";
}

void SetupLogging(const config::DaemonOptions& opts) {
  util::LogLevel level = util::LogLevel::kInfo;
  try {
    level = util::ParseLogLevel(opts.log_level);
  } catch (const std::exception& ex) {
    std::cerr << "[refundd] warn: " << ex.what() << " (falling back to info level)\n";
  }
  std::uintmax_t max_bytes = 0;
  if (opts.log_max_size_mb > 0) {
    max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
  }
  util::ConfigureLogging(level, max_bytes, opts.log_max_files);
  if (!opts.log_path.empty()) {
    util::EnableFileLogging(opts.log_path);
  }
}

nlohmann::json ParseErrorResponse(const std::string& message) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  response["id"] = nullptr;
  response["error"] = {{"code", -32700}, {"message", "parse error: " + message}};
  return response;
}

}  // namespace

int main(int argc, char** argv) {
  try {
    std::vector<std::string> args(argv + 1, argv + argc);
    const auto opts = config::ParseDaemonOptions(args);
    if (opts.show_help) {
      PrintUsage();
      return 0;
    }
    try {
      SetupLogging(opts);
    } catch (const std::exception& ex) {
      std::cerr << "[refundd] fatal: " << ex.what() << "\n";
      return 1;
    }

    util::LogInfo("refundd", "starting on network=" + opts.network +
                                 ", ledger_id=" + config::GetLedgerConfig().ledger_id +
                                 ", data_dir=" + opts.data_dir +
                                 ", snapshot=" + opts.snapshot_path +
                                 ", payouts=" + opts.payout_journal_path +
                                 (opts.read_only ? ", read-only" : ""));

    node::PayoutJournal payouts(opts.payout_journal_path);
    node::LoggingEventSink events;
    consensus::RefundLedger ledger(&payouts, &events);

    node::LedgerStore store(opts.snapshot_path, &payouts);
    std::string load_error;
    if (!store.Load(&ledger, &load_error)) {
      util::LogError("refundd", load_error);
      std::cerr << "[refundd] fatal: " << load_error << "\n";
      return 1;
    }

    rpc::LedgerRpcServer server(ledger, opts.read_only);
    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) {
        continue;
      }
      nlohmann::json request;
      try {
        request = nlohmann::json::parse(line);
      } catch (const nlohmann::json::parse_error& ex) {
        std::cout << ParseErrorResponse(ex.what()).dump() << std::endl;
        continue;
      }
      const auto response = server.Handle(request);
      const bool mutated = !response.contains("error") && request.contains("method") &&
                           request["method"].is_string() &&
                           rpc::IsMutatingMethod(request["method"].get<std::string>());
      if (!mutated) {
        store.DropUncommitted();
        std::cout << response.dump() << std::endl;
        continue;
      }
      // The response goes out only once the snapshot and the journal agree.
      std::string persist_error;
      if (!store.PersistCommitted(ledger, &persist_error)) {
        util::LogError("refundd", persist_error);
        std::cerr << "[refundd] fatal: " << persist_error << "\n";
        return 1;
      }
      std::cout << response.dump() << std::endl;
    }
    util::LogInfo("refundd", "input closed, shutting down");
  } catch (const std::exception& ex) {
    std::cerr << "[refundd] fatal: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
