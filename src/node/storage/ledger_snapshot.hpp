#pragma once

#include <string>

#include "consensus/refund_state.hpp"

namespace refundledger::storage {

// Persist all four stores, sorted by key, tagged with the active ledger id
// and sealed with a SHA3-256 checksum. The file is replaced atomically.
bool SaveLedgerSnapshot(const consensus::RefundState& state, const std::string& path,
                        std::string* error = nullptr);

// Replace `*state` with the snapshot at `path`. On any failure `*state` is
// left as it was.
bool LoadLedgerSnapshot(consensus::RefundState* state, const std::string& path,
                        std::string* error = nullptr);

}  // namespace refundledger::storage
