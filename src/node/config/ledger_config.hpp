#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace refundledger::config {

enum class LedgerNetwork {
  kMainnet,
  kTestnet,
  kRegtest,
};

struct LedgerConfig {
  LedgerNetwork network{LedgerNetwork::kMainnet};
  // Written into every snapshot; a snapshot from another ledger id is
  // refused on load.
  std::string ledger_id{"refund-mainnet"};
  // Directory name used under the platform data root.
  std::string data_dir_name{"mainnet"};
};

const LedgerConfig& GetLedgerConfig();
void SelectNetwork(LedgerNetwork network);
// Accepts "mainnet"/"main", "testnet"/"test" and "regtest"/"reg".
std::optional<LedgerNetwork> LedgerNetworkFromString(std::string_view name);
std::string_view LedgerNetworkName(LedgerNetwork network);

// $XDG_DATA_HOME/refundd/<network>, falling back to ~/.refundd/<network>
// and finally ./data/<network>.
std::string DefaultDataDir(LedgerNetwork network);

}  // namespace refundledger::config
