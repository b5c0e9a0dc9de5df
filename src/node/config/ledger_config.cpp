#include "config/ledger_config.hpp"

#include <cstdlib>
#include <filesystem>

namespace refundledger::config {

namespace {

LedgerConfig BuildConfig(LedgerNetwork network, std::string ledger_id, std::string dir_name) {
  LedgerConfig cfg;
  cfg.network = network;
  cfg.ledger_id = std::move(ledger_id);
  cfg.data_dir_name = std::move(dir_name);
  return cfg;
}

const LedgerConfig& ConfigFor(LedgerNetwork network) {
  static const LedgerConfig mainnet =
      BuildConfig(LedgerNetwork::kMainnet, "refund-mainnet", "mainnet");
  static const LedgerConfig testnet =
      BuildConfig(LedgerNetwork::kTestnet, "refund-testnet", "testnet");
  static const LedgerConfig regtest =
      BuildConfig(LedgerNetwork::kRegtest, "refund-regtest", "regtest");
  switch (network) {
    case LedgerNetwork::kMainnet:
      return mainnet;
    case LedgerNetwork::kTestnet:
      return testnet;
    case LedgerNetwork::kRegtest:
      return regtest;
  }
  return mainnet;
}

LedgerConfig g_ledger_config = ConfigFor(LedgerNetwork::kMainnet);

}  // namespace

const LedgerConfig& GetLedgerConfig() { return g_ledger_config; }

void SelectNetwork(LedgerNetwork network) { g_ledger_config = ConfigFor(network); }

std::optional<LedgerNetwork> LedgerNetworkFromString(std::string_view name) {
  if (name == "mainnet" || name == "main") return LedgerNetwork::kMainnet;
  if (name == "testnet" || name == "test") return LedgerNetwork::kTestnet;
  if (name == "regtest" || name == "reg") return LedgerNetwork::kRegtest;
  return std::nullopt;
}

std::string_view LedgerNetworkName(LedgerNetwork network) {
  switch (network) {
    case LedgerNetwork::kMainnet:
      return "mainnet";
    case LedgerNetwork::kTestnet:
      return "testnet";
    case LedgerNetwork::kRegtest:
      return "regtest";
  }
  return "mainnet";
}

std::string DefaultDataDir(LedgerNetwork network) {
  const std::string name = ConfigFor(network).data_dir_name;
  std::filesystem::path base;
  if (const char* xdg_data = std::getenv("XDG_DATA_HOME"); xdg_data && xdg_data[0] != '\0') {
    base = std::filesystem::path(xdg_data) / "refundd" / name;
  } else if (const char* home = std::getenv("HOME"); home && home[0] != '\0') {
    base = std::filesystem::path(home) / ".refundd" / name;
  } else {
    base = std::filesystem::path("data") / name;
  }
  return base.string();
}

}  // namespace refundledger::config
