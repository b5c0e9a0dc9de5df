#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace refundledger::config {

struct DaemonOptions {
  std::string network{"mainnet"};
  std::string data_dir;
  std::string snapshot_path;
  std::string payout_journal_path;
  std::string log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  bool read_only{false};
  std::string config_path;
  bool disable_config_file{false};
  bool show_help{false};
};

bool ParseBool(const std::string& value);

// Apply one `key=value` setting. Keys are compared case-insensitively with
// '-' and '_' removed. Unknown keys are reported on stderr and ignored.
void ApplyConfigOption(const std::string& raw_key, const std::string& value,
                       DaemonOptions* opts);

// Load `refundd.conf` style settings. A missing file is not an error; a
// malformed value throws std::runtime_error naming the file and line.
void LoadConfigFile(const std::filesystem::path& path, DaemonOptions* opts);

// REFUNDD_NETWORK, REFUNDD_DATA_DIR, REFUNDD_SNAPSHOT_PATH,
// REFUNDD_PAYOUT_JOURNAL, REFUNDD_LOG_FILE, REFUNDD_LOG_LEVEL,
// REFUNDD_LOG_MAX_SIZE_MB, REFUNDD_LOG_MAX_FILES, REFUNDD_READ_ONLY.
void ApplyEnvironmentOverrides(DaemonOptions* opts);

// Precedence, lowest first: config file, environment, command line. Selects
// the network and fills in data-dir derived paths. Throws
// std::runtime_error on bad input.
DaemonOptions ParseDaemonOptions(const std::vector<std::string>& argv);

}  // namespace refundledger::config
