#include "config/daemon_options.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "config/ledger_config.hpp"

namespace refundledger::config {

namespace {

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::string NormalizeKey(const std::string& key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

std::size_t ParseSize(const std::string& value, std::string_view name) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::runtime_error("invalid " + std::string(name) + " (expected a non-negative integer)");
  }
  try {
    return static_cast<std::size_t>(std::stoull(value));
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + std::string(name) + " (out of range)");
  }
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       DaemonOptions* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    opts->network = value;
  } else if (key == "datadir" || key == "datadirectory") {
    opts->data_dir = value;
  } else if (key == "snapshot" || key == "snapshotpath") {
    opts->snapshot_path = value;
  } else if (key == "payoutjournal" || key == "payoutjournalpath") {
    opts->payout_journal_path = value;
  } else if (key == "logfile" || key == "debuglog") {
    opts->log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = ParseSize(value, "log-max-size-mb");
  } else if (key == "logmaxfiles") {
    opts->log_max_files = ParseSize(value, "log-max-files");
  } else if (key == "readonly") {
    opts->read_only = ParseBool(value);
  } else if (key == "config" || key == "conf") {
    opts->config_path = value;
  } else {
    std::cerr << "[refundd] warn: unknown config key '" << raw_key << "'\n";
  }
}

void LoadConfigFile(const std::filesystem::path& path, DaemonOptions* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

void ApplyEnvironmentOverrides(DaemonOptions* opts) {
  auto apply_string = [&](std::string_view name, std::string* target) {
    if (auto value = GetEnvValue(name)) {
      *target = std::move(*value);
    }
  };
  auto apply_size = [&](std::string_view name, std::size_t* target) {
    if (auto value = GetEnvValue(name)) {
      *target = ParseSize(*value, name);
    }
  };

  apply_string("REFUNDD_NETWORK", &opts->network);
  apply_string("REFUNDD_DATA_DIR", &opts->data_dir);
  apply_string("REFUNDD_SNAPSHOT_PATH", &opts->snapshot_path);
  apply_string("REFUNDD_PAYOUT_JOURNAL", &opts->payout_journal_path);
  apply_string("REFUNDD_LOG_FILE", &opts->log_path);
  apply_string("REFUNDD_LOG_LEVEL", &opts->log_level);
  apply_size("REFUNDD_LOG_MAX_SIZE_MB", &opts->log_max_size_mb);
  apply_size("REFUNDD_LOG_MAX_FILES", &opts->log_max_files);
  if (auto value = GetEnvValue("REFUNDD_READ_ONLY")) {
    opts->read_only = ParseBool(*value);
  }
}

DaemonOptions ParseDaemonOptions(const std::vector<std::string>& argv) {
  DaemonOptions opts;
  std::vector<std::string> args;
  args.reserve(argv.size());
  for (const auto& token : argv) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  // The config file location has to be known before anything else applies.
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      opts.show_help = true;
      return opts;
    }
    if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    }
  }
  if (!opts.disable_config_file) {
    const std::filesystem::path config_path = opts.config_path.empty()
                                                  ? std::filesystem::path("refundd.conf")
                                                  : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }
  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--network") {
      opts.network = ensure_value(i);
    } else if (arg == "--data-dir") {
      opts.data_dir = ensure_value(i);
    } else if (arg == "--snapshot") {
      opts.snapshot_path = ensure_value(i);
    } else if (arg == "--payout-journal") {
      opts.payout_journal_path = ensure_value(i);
    } else if (arg == "--log-file") {
      opts.log_path = ensure_value(i);
    } else if (arg == "--log-level") {
      opts.log_level = ensure_value(i);
    } else if (arg == "--log-max-size-mb") {
      opts.log_max_size_mb = ParseSize(ensure_value(i), "--log-max-size-mb");
    } else if (arg == "--log-max-files") {
      opts.log_max_files = ParseSize(ensure_value(i), "--log-max-files");
    } else if (arg == "--read-only") {
      opts.read_only = true;
    } else if (arg == "--conf") {
      ++i;
    } else if (arg == "--no-conf") {
      continue;
    } else {
      throw std::runtime_error("unknown option: " + arg);
    }
  }

  const auto network = LedgerNetworkFromString(opts.network);
  if (!network) {
    throw std::runtime_error("unknown network: " + opts.network);
  }
  SelectNetwork(*network);
  opts.network = std::string(LedgerNetworkName(*network));
  if (opts.data_dir.empty()) {
    opts.data_dir = DefaultDataDir(*network);
  }
  const std::filesystem::path data_root(opts.data_dir);
  if (opts.snapshot_path.empty()) {
    opts.snapshot_path = (data_root / "ledger.dat").string();
  }
  if (opts.payout_journal_path.empty()) {
    opts.payout_journal_path = (data_root / "payouts.jsonl").string();
  }
  return opts;
}

}  // namespace refundledger::config
