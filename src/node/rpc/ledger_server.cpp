#include "rpc/ledger_server.hpp"

#include <stdexcept>
#include <unordered_set>
#include <vector>

#include "config/ledger_config.hpp"
#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace refundledger::rpc {

namespace {

// Lightweight RPC exception that carries a structured error code in
// addition to the human-readable message.
struct RpcError : public std::runtime_error {
  int code;
  RpcError(int c, const std::string& msg) : std::runtime_error(msg), code(c) {}
};

[[noreturn]] void ThrowRpcError(int code, const std::string& msg) {
  throw RpcError(code, msg);
}

constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kReadOnly = -32001;

const nlohmann::json& RequireParam(const nlohmann::json& params, const char* name) {
  if (!params.is_object() || !params.contains(name)) {
    ThrowRpcError(kInvalidParams, std::string("missing parameter '") + name + "'");
  }
  return params.at(name);
}

std::string RequireString(const nlohmann::json& params, const char* name) {
  const auto& value = RequireParam(params, name);
  if (!value.is_string()) {
    ThrowRpcError(kInvalidParams, std::string("parameter '") + name + "' must be a string");
  }
  return value.get<std::string>();
}

primitives::Address ParseAddressValue(const std::string& text, const char* name) {
  primitives::Address address{};
  if (!primitives::ParseAddress(text, &address)) {
    ThrowRpcError(kInvalidParams, std::string("invalid address for '") + name + "'");
  }
  return address;
}

primitives::Address RequireAddress(const nlohmann::json& params, const char* name) {
  return ParseAddressValue(RequireString(params, name), name);
}

primitives::Hash256 ParseHashValue(const nlohmann::json& value, const char* name) {
  primitives::Hash256 hash{};
  if (!value.is_string() || !primitives::ParseHash256(value.get<std::string>(), &hash)) {
    ThrowRpcError(kInvalidParams, std::string("invalid hash in '") + name + "'");
  }
  return hash;
}

// Amounts travel as decimal strings; small non-negative JSON integers are
// accepted too.
primitives::Amount ParseAmountValue(const nlohmann::json& value, const char* name) {
  primitives::Amount amount;
  if (value.is_number_unsigned()) {
    return primitives::Amount(value.get<std::uint64_t>());
  }
  if (!value.is_string() || !primitives::ParseAmount(value.get<std::string>(), &amount)) {
    ThrowRpcError(kInvalidParams, std::string("invalid amount in '") + name + "'");
  }
  return amount;
}

primitives::Amount RequireAmount(const nlohmann::json& params, const char* name) {
  return ParseAmountValue(RequireParam(params, name), name);
}

std::vector<primitives::Hash256> RequireHashArray(const nlohmann::json& params, const char* name) {
  const auto& value = RequireParam(params, name);
  if (!value.is_array()) {
    ThrowRpcError(kInvalidParams, std::string("parameter '") + name + "' must be an array");
  }
  std::vector<primitives::Hash256> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    out.push_back(ParseHashValue(item, name));
  }
  return out;
}

std::vector<primitives::Amount> RequireAmountArray(const nlohmann::json& params,
                                                   const char* name) {
  const auto& value = RequireParam(params, name);
  if (!value.is_array()) {
    ThrowRpcError(kInvalidParams, std::string("parameter '") + name + "' must be an array");
  }
  std::vector<primitives::Amount> out;
  out.reserve(value.size());
  for (const auto& item : value) {
    out.push_back(ParseAmountValue(item, name));
  }
  return out;
}

nlohmann::json HashesToJson(const std::vector<primitives::Hash256>& hashes) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& hash : hashes) {
    out.push_back(primitives::HashToHex(hash));
  }
  return out;
}

nlohmann::json AmountsToJson(const std::vector<primitives::Amount>& amounts) {
  nlohmann::json out = nlohmann::json::array();
  for (const auto& amount : amounts) {
    out.push_back(amount.ToString());
  }
  return out;
}

void ThrowIfFailed(const consensus::LedgerResult& result) {
  if (!result.ok) {
    ThrowRpcError(LedgerErrorCode(result.code),
                  std::string(consensus::LedgerErrorName(result.code)) + ": " + result.error);
  }
}

}  // namespace

int LedgerErrorCode(consensus::LedgerError error) {
  switch (error) {
    case consensus::LedgerError::kNone:
      return 0;
    case consensus::LedgerError::kLengthMismatch:
      return -32010;
    case consensus::LedgerError::kNoBatches:
      return -32011;
    case consensus::LedgerError::kInsufficientBalance:
      return -32012;
    case consensus::LedgerError::kInsufficientFunderBalance:
      return -32013;
    case consensus::LedgerError::kNotRefundable:
      return -32014;
    case consensus::LedgerError::kNothingToWithdraw:
      return -32015;
    case consensus::LedgerError::kTransferFailed:
      return -32016;
    case consensus::LedgerError::kAmountOverflow:
      return -32017;
    case consensus::LedgerError::kReentrantPayout:
      return -32018;
  }
  return kInternalError;
}

bool IsMutatingMethod(const std::string& method) {
  static const std::unordered_set<std::string> kMutating{
      "setbatches",    "increasebalance", "withdrawamount",
      "withdraw",      "removebatches",   "refund"};
  return kMutating.find(method) != kMutating.end();
}

nlohmann::json EventToJson(const consensus::LedgerEvent& event) {
  nlohmann::json out;
  out["event"] = consensus::LedgerEventName(event.type);
  out["refunder"] = primitives::AddressToHex(event.refunder);
  switch (event.type) {
    case consensus::LedgerEventType::kBatchesChanged:
      out["roots"] = HashesToJson(event.roots);
      out["amounts"] = AmountsToJson(event.amounts);
      break;
    case consensus::LedgerEventType::kBatchesRemoved:
      out["roots"] = HashesToJson(event.roots);
      out["amounts"] = AmountsToJson(event.amounts);
      out["amount"] = event.amount.ToString();
      break;
    case consensus::LedgerEventType::kRefunded:
      out["recipient"] = primitives::AddressToHex(event.recipient);
      out["amount"] = event.amount.ToString();
      break;
    case consensus::LedgerEventType::kBalanceIncreased:
    case consensus::LedgerEventType::kBalanceDecreased:
    case consensus::LedgerEventType::kBalanceWithdrawn:
      out["amount"] = event.amount.ToString();
      break;
  }
  return out;
}

LedgerRpcServer::LedgerRpcServer(consensus::RefundLedger& ledger, bool read_only)
    : ledger_(ledger), read_only_(read_only) {}

nlohmann::json LedgerRpcServer::Handle(const nlohmann::json& request) {
  nlohmann::json response;
  response["jsonrpc"] = "2.0";
  if (request.is_object() && request.contains("id")) {
    response["id"] = request["id"];
  } else {
    response["id"] = nullptr;
  }
  try {
    if (!request.is_object() || !request.contains("method") || !request.at("method").is_string()) {
      ThrowRpcError(kInvalidRequest, "invalid request");
    }
    const auto method = request.at("method").get<std::string>();
    const nlohmann::json params =
        request.contains("params") ? request.at("params") : nlohmann::json::object();
    if (!params.is_object()) {
      ThrowRpcError(kInvalidParams, "params must be an object");
    }
    if (read_only_ && IsMutatingMethod(method)) {
      ThrowRpcError(kReadOnly, "RPC method disabled in read-only mode");
    }
    if (method == "setbatches") {
      response["result"] = HandleSetBatches(params);
    } else if (method == "increasebalance") {
      response["result"] = HandleIncreaseBalance(params);
    } else if (method == "withdrawamount") {
      response["result"] = HandleWithdrawAmount(params);
    } else if (method == "withdraw") {
      response["result"] = HandleWithdraw(params);
    } else if (method == "removebatches") {
      response["result"] = HandleRemoveBatches(params);
    } else if (method == "refund") {
      response["result"] = HandleRefund(params);
    } else if (method == "getbatches") {
      response["result"] = HandleGetBatches(params);
    } else if (method == "getbalance") {
      response["result"] = HandleGetBalance(params);
    } else if (method == "isrefunded") {
      response["result"] = HandleIsRefunded(params);
    } else if (method == "findrefundablebatch") {
      response["result"] = HandleFindRefundableBatch(params);
    } else if (method == "getledgerinfo") {
      response["result"] = HandleGetLedgerInfo();
    } else {
      response["error"] = {{"code", kMethodNotFound}, {"message", "unknown method"}};
    }
  } catch (const RpcError& ex) {
    response["error"] = {{"code", ex.code}, {"message", ex.what()}};
  } catch (const std::exception& ex) {
    response["error"] = {{"code", kInternalError}, {"message", ex.what()}};
  }
  return response;
}

nlohmann::json LedgerRpcServer::HandleSetBatches(const nlohmann::json& params) {
  const auto caller = RequireAddress(params, "caller");
  auto roots = RequireHashArray(params, "roots");
  auto amounts = RequireAmountArray(params, "amounts");
  primitives::Amount value;
  if (params.contains("value")) {
    value = ParseAmountValue(params.at("value"), "value");
  }
  const std::size_t batch_count = roots.size();
  const auto result = ledger_.SetBatches(caller, std::move(roots), std::move(amounts), value);
  ThrowIfFailed(result);
  nlohmann::json out;
  out["refunder"] = primitives::AddressToHex(caller);
  out["batches"] = batch_count;
  out["balance"] = ledger_.BalanceOf(caller).ToString();
  return out;
}

nlohmann::json LedgerRpcServer::HandleIncreaseBalance(const nlohmann::json& params) {
  const auto caller = RequireAddress(params, "caller");
  const auto amount = RequireAmount(params, "amount");
  ThrowIfFailed(ledger_.IncreaseBalance(caller, amount));
  nlohmann::json out;
  out["balance"] = ledger_.BalanceOf(caller).ToString();
  return out;
}

nlohmann::json LedgerRpcServer::HandleWithdrawAmount(const nlohmann::json& params) {
  const auto caller = RequireAddress(params, "caller");
  const auto amount = RequireAmount(params, "amount");
  const auto result = ledger_.WithdrawAmount(caller, amount);
  ThrowIfFailed(result);
  nlohmann::json out;
  out["paid"] = result.amount.ToString();
  out["balance"] = ledger_.BalanceOf(caller).ToString();
  return out;
}

nlohmann::json LedgerRpcServer::HandleWithdraw(const nlohmann::json& params) {
  const auto caller = RequireAddress(params, "caller");
  const auto result = ledger_.Withdraw(caller);
  ThrowIfFailed(result);
  nlohmann::json out;
  out["paid"] = result.amount.ToString();
  out["balance"] = ledger_.BalanceOf(caller).ToString();
  return out;
}

nlohmann::json LedgerRpcServer::HandleRemoveBatches(const nlohmann::json& params) {
  const auto caller = RequireAddress(params, "caller");
  const auto result = ledger_.RemoveBatches(caller);
  ThrowIfFailed(result);
  nlohmann::json out;
  out["paid"] = result.amount.ToString();
  out["balance"] = ledger_.BalanceOf(caller).ToString();
  return out;
}

nlohmann::json LedgerRpcServer::HandleRefund(const nlohmann::json& params) {
  const auto caller = RequireAddress(params, "caller");
  const auto refunder = RequireAddress(params, "refunder");
  const auto proof = RequireHashArray(params, "proof");
  const auto result = ledger_.Refund(caller, refunder, proof);
  ThrowIfFailed(result);
  if (!result.batch_index) {
    ThrowRpcError(kInternalError, "refund committed without a batch index");
  }
  nlohmann::json out;
  out["refunder"] = primitives::AddressToHex(refunder);
  out["recipient"] = primitives::AddressToHex(caller);
  out["paid"] = result.amount.ToString();
  out["batch_index"] = *result.batch_index;
  return out;
}

nlohmann::json LedgerRpcServer::HandleGetBatches(const nlohmann::json& params) const {
  const auto refunder = RequireAddress(params, "refunder");
  nlohmann::json out;
  out["roots"] = HashesToJson(ledger_.Roots(refunder));
  out["amounts"] = AmountsToJson(ledger_.Amounts(refunder));
  return out;
}

nlohmann::json LedgerRpcServer::HandleGetBalance(const nlohmann::json& params) const {
  const auto refunder = RequireAddress(params, "refunder");
  nlohmann::json out;
  out["balance"] = ledger_.BalanceOf(refunder).ToString();
  return out;
}

nlohmann::json LedgerRpcServer::HandleIsRefunded(const nlohmann::json& params) const {
  const auto refunder = RequireAddress(params, "refunder");
  const auto recipient = RequireAddress(params, "recipient");
  nlohmann::json out;
  out["refunded"] = ledger_.IsRefunded(refunder, recipient);
  return out;
}

nlohmann::json LedgerRpcServer::HandleFindRefundableBatch(const nlohmann::json& params) const {
  const auto refunder = RequireAddress(params, "refunder");
  const auto recipient = RequireAddress(params, "recipient");
  const auto proof = RequireHashArray(params, "proof");
  nlohmann::json out;
  if (const auto index = ledger_.FindRefundableBatch(refunder, recipient, proof)) {
    out["batch_index"] = *index;
    out["amount"] = ledger_.Amounts(refunder)[*index].ToString();
  } else {
    out["batch_index"] = nullptr;
  }
  return out;
}

nlohmann::json LedgerRpcServer::HandleGetLedgerInfo() const {
  const auto& cfg = config::GetLedgerConfig();
  const auto& state = ledger_.State();
  const auto telemetry = ledger_.GetTelemetry();
  nlohmann::json out;
  out["network"] = std::string(config::LedgerNetworkName(cfg.network));
  out["ledger_id"] = cfg.ledger_id;
  out["read_only"] = read_only_;
  out["batch_sets"] = state.BatchSetCount();
  out["balances"] = state.BalanceCount();
  out["refunds"] = state.RefundCount();
  out["committed_operations"] = telemetry.committed_operations;
  out["failed_operations"] = telemetry.failed_operations;
  out["refunds_paid"] = telemetry.refunds_paid;
  out["payout_failures"] = telemetry.payout_failures;
  return out;
}

}  // namespace refundledger::rpc
