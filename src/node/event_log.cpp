#include "node/event_log.hpp"

#include "rpc/ledger_server.hpp"
#include "util/logging.hpp"

namespace refundledger::node {

void LoggingEventSink::OnEvent(const consensus::LedgerEvent& event) {
  ++delivered_;
  util::LogInfo("event", rpc::EventToJson(event).dump());
}

}  // namespace refundledger::node
