#include "node/payout_journal.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <system_error>
#include <utility>

#include "nlohmann/json.hpp"
#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace refundledger::node {

PayoutJournal::PayoutJournal(std::string path) : path_(std::move(path)) {}

bool PayoutJournal::Transfer(const primitives::Address& recipient,
                             const primitives::Amount& amount, std::string* error) {
  if (path_.empty()) {
    if (error) *error = "payout journal path not configured";
    return false;
  }
  std::error_code ec;
  if (std::filesystem::is_directory(path_, ec)) {
    if (error) *error = "payout journal: " + path_ + " is a directory";
    return false;
  }
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  nlohmann::json entry;
  entry["seq"] = appended_ + pending_.size() + 1;
  entry["time"] = std::chrono::duration_cast<std::chrono::seconds>(now).count();
  entry["to"] = primitives::AddressToHex(recipient);
  entry["amount"] = amount.ToString();
  pending_.push_back(entry.dump());
  util::LogDebug("payout", "staged " + amount.ToString() + " to " +
                               primitives::AddressToHex(recipient));
  return true;
}

bool PayoutJournal::Commit(std::string* error) {
  std::size_t written = 0;
  std::string write_error;
  for (; written < pending_.size(); ++written) {
    if (!util::AppendLine(std::filesystem::path(path_), pending_[written], &write_error)) {
      break;
    }
    ++appended_;
    util::LogInfo("payout", "queued " + pending_[written]);
  }
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(written));
  if (pending_.empty()) {
    return true;
  }
  for (const auto& unwritten : pending_) {
    util::LogError("payout", "unwritten " + unwritten);
  }
  if (error) *error = "payout journal: " + write_error;
  return false;
}

void PayoutJournal::Discard() {
  if (!pending_.empty()) {
    util::LogWarn("payout", "dropping " + std::to_string(pending_.size()) +
                                " staged payout(s) that were never persisted");
  }
  pending_.clear();
}

}  // namespace refundledger::node
