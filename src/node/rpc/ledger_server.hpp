#pragma once

#include <string>

#include "consensus/refund_events.hpp"
#include "consensus/refund_ledger.hpp"
#include "nlohmann/json.hpp"

namespace refundledger::rpc {

// JSON-RPC error code reported for a failed ledger operation.
int LedgerErrorCode(consensus::LedgerError error);

// Methods that change ledger state. Rejected in read-only mode.
bool IsMutatingMethod(const std::string& method);

nlohmann::json EventToJson(const consensus::LedgerEvent& event);

// JSON-RPC 2.0 front end for a RefundLedger. Parameters are passed by name;
// the acting principal is the "caller" parameter.
class LedgerRpcServer {
 public:
  LedgerRpcServer(consensus::RefundLedger& ledger, bool read_only);

  nlohmann::json Handle(const nlohmann::json& request);

  bool ReadOnly() const noexcept { return read_only_; }

 private:
  nlohmann::json HandleSetBatches(const nlohmann::json& params);
  nlohmann::json HandleIncreaseBalance(const nlohmann::json& params);
  nlohmann::json HandleWithdrawAmount(const nlohmann::json& params);
  nlohmann::json HandleWithdraw(const nlohmann::json& params);
  nlohmann::json HandleRemoveBatches(const nlohmann::json& params);
  nlohmann::json HandleRefund(const nlohmann::json& params);
  nlohmann::json HandleGetBatches(const nlohmann::json& params) const;
  nlohmann::json HandleGetBalance(const nlohmann::json& params) const;
  nlohmann::json HandleIsRefunded(const nlohmann::json& params) const;
  nlohmann::json HandleFindRefundableBatch(const nlohmann::json& params) const;
  nlohmann::json HandleGetLedgerInfo() const;

  consensus::RefundLedger& ledger_;
  bool read_only_{false};
};

}  // namespace refundledger::rpc
