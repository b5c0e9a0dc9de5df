#pragma once

#include <cstdint>

#include "consensus/refund_events.hpp"

namespace refundledger::node {

// Writes each committed ledger event to the log as a JSON object.
class LoggingEventSink : public consensus::EventSink {
 public:
  void OnEvent(const consensus::LedgerEvent& event) override;

  std::uint64_t Delivered() const noexcept { return delivered_; }

 private:
  std::uint64_t delivered_{0};
};

}  // namespace refundledger::node
