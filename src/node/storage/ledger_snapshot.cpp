#include "storage/ledger_snapshot.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>
#include <span>
#include <utility>
#include <vector>

#include "config/ledger_config.hpp"
#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"

namespace refundledger::storage {

namespace {

constexpr std::uint32_t kLedgerMagicV1 = 0x31534C52;  // 'RLS1' (little-endian uint32)
constexpr std::uint16_t kLedgerVersionV1 = 1;
constexpr std::size_t kMaxLedgerIdLength = 64;
constexpr std::size_t kChecksumSize = 32;

namespace ser = primitives::serialize;

struct BatchSetEntry {
  primitives::Address refunder{};
  const consensus::RefundState::Roots* roots{nullptr};
  const consensus::RefundState::Amounts* amounts{nullptr};
};

bool Fail(std::string* error, std::string message) {
  if (error) {
    *error = std::move(message);
  }
  return false;
}

bool KeyLess(const consensus::RefundKey& a, const consensus::RefundKey& b) {
  if (a.refunder != b.refunder) {
    return a.refunder < b.refunder;
  }
  return a.recipient < b.recipient;
}

std::vector<std::uint8_t> Serialize(const consensus::RefundState& state) {
  std::vector<std::uint8_t> out;
  ser::WriteUint32(&out, kLedgerMagicV1);
  ser::WriteUint16(&out, kLedgerVersionV1);
  const auto& ledger_id = config::GetLedgerConfig().ledger_id;
  ser::WriteVarInt(&out, ledger_id.size());
  ser::WriteBytes(&out, std::span<const std::uint8_t>(
                            reinterpret_cast<const std::uint8_t*>(ledger_id.data()),
                            ledger_id.size()));

  std::vector<BatchSetEntry> batches;
  batches.reserve(state.BatchSetCount());
  state.ForEachBatchSet([&](const primitives::Address& refunder,
                            const consensus::RefundState::Roots& roots,
                            const consensus::RefundState::Amounts& amounts) {
    batches.push_back(BatchSetEntry{refunder, &roots, &amounts});
    return true;
  });
  std::sort(batches.begin(), batches.end(),
            [](const BatchSetEntry& a, const BatchSetEntry& b) { return a.refunder < b.refunder; });
  ser::WriteVarInt(&out, batches.size());
  for (const auto& entry : batches) {
    ser::WriteAddress(&out, entry.refunder);
    ser::WriteVarInt(&out, entry.roots->size());
    for (const auto& root : *entry.roots) {
      ser::WriteHash(&out, root);
    }
    ser::WriteVarInt(&out, entry.amounts->size());
    for (const auto& amount : *entry.amounts) {
      ser::WriteAmount(&out, amount);
    }
  }

  std::vector<std::pair<primitives::Address, primitives::Amount>> balances;
  balances.reserve(state.BalanceCount());
  state.ForEachBalance([&](const primitives::Address& refunder, const primitives::Amount& balance) {
    balances.emplace_back(refunder, balance);
    return true;
  });
  std::sort(balances.begin(), balances.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  ser::WriteVarInt(&out, balances.size());
  for (const auto& [refunder, balance] : balances) {
    ser::WriteAddress(&out, refunder);
    ser::WriteAmount(&out, balance);
  }

  std::vector<consensus::RefundKey> refunds;
  refunds.reserve(state.RefundCount());
  state.ForEachRefund([&](const consensus::RefundKey& key) {
    refunds.push_back(key);
    return true;
  });
  std::sort(refunds.begin(), refunds.end(), KeyLess);
  ser::WriteVarInt(&out, refunds.size());
  for (const auto& key : refunds) {
    ser::WriteAddress(&out, key.refunder);
    ser::WriteAddress(&out, key.recipient);
  }

  const auto checksum = crypto::Sha3_256(std::span<const std::uint8_t>(out.data(), out.size()));
  ser::WriteBytes(&out, std::span<const std::uint8_t>(checksum.data(), checksum.size()));
  return out;
}

// Element counts can never exceed the bytes left in the body.
bool ReadCount(const std::vector<std::uint8_t>& body, std::size_t* offset, std::size_t min_size,
               std::uint64_t* count) {
  if (!ser::ReadVarInt(body, offset, count)) {
    return false;
  }
  const std::size_t remaining = body.size() - *offset;
  return *count <= remaining / min_size;
}

bool Deserialize(const std::vector<std::uint8_t>& body, consensus::RefundState* state,
                 std::string* error) {
  std::size_t offset = 0;
  std::uint32_t magic = 0;
  if (!ser::ReadUint32(body, &offset, &magic) || magic != kLedgerMagicV1) {
    return Fail(error, "bad snapshot magic");
  }
  std::uint16_t version = 0;
  if (!ser::ReadUint16(body, &offset, &version) || version != kLedgerVersionV1) {
    return Fail(error, "unsupported snapshot version");
  }
  std::uint64_t id_len = 0;
  if (!ser::ReadVarInt(body, &offset, &id_len) || id_len > kMaxLedgerIdLength) {
    return Fail(error, "bad ledger id");
  }
  std::string ledger_id(static_cast<std::size_t>(id_len), '\0');
  if (!ser::ReadBytes(body, &offset,
                      std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(ledger_id.data()),
                                              ledger_id.size()))) {
    return Fail(error, "truncated snapshot");
  }
  if (ledger_id != config::GetLedgerConfig().ledger_id) {
    return Fail(error, "snapshot belongs to ledger '" + ledger_id + "'");
  }

  std::uint64_t batch_count = 0;
  if (!ReadCount(body, &offset, 20 + 2, &batch_count)) {
    return Fail(error, "truncated snapshot");
  }
  std::optional<primitives::Address> previous;
  for (std::uint64_t i = 0; i < batch_count; ++i) {
    primitives::Address refunder{};
    if (!ser::ReadAddress(body, &offset, &refunder)) {
      return Fail(error, "truncated snapshot");
    }
    if (previous && !(*previous < refunder)) {
      return Fail(error, "duplicate or unordered batch entry");
    }
    previous = refunder;
    std::uint64_t root_count = 0;
    if (!ReadCount(body, &offset, 32, &root_count)) {
      return Fail(error, "truncated snapshot");
    }
    consensus::RefundState::Roots roots(static_cast<std::size_t>(root_count));
    for (auto& root : roots) {
      if (!ser::ReadHash(body, &offset, &root)) {
        return Fail(error, "truncated snapshot");
      }
    }
    std::uint64_t amount_count = 0;
    if (!ReadCount(body, &offset, 32, &amount_count)) {
      return Fail(error, "truncated snapshot");
    }
    consensus::RefundState::Amounts amounts(static_cast<std::size_t>(amount_count));
    for (auto& amount : amounts) {
      if (!ser::ReadAmount(body, &offset, &amount)) {
        return Fail(error, "truncated snapshot");
      }
    }
    if (roots.empty() || roots.size() != amounts.size()) {
      return Fail(error, "batch entry roots/amounts length mismatch");
    }
    state->SetBatches(refunder, std::move(roots), std::move(amounts));
  }

  std::uint64_t balance_count = 0;
  if (!ReadCount(body, &offset, 20 + 32, &balance_count)) {
    return Fail(error, "truncated snapshot");
  }
  previous.reset();
  for (std::uint64_t i = 0; i < balance_count; ++i) {
    primitives::Address refunder{};
    primitives::Amount balance;
    if (!ser::ReadAddress(body, &offset, &refunder) || !ser::ReadAmount(body, &offset, &balance)) {
      return Fail(error, "truncated snapshot");
    }
    if (previous && !(*previous < refunder)) {
      return Fail(error, "duplicate or unordered balance entry");
    }
    previous = refunder;
    if (balance.IsZero()) {
      return Fail(error, "zero balance entry");
    }
    state->SetBalance(refunder, balance);
  }

  std::uint64_t refund_count = 0;
  if (!ReadCount(body, &offset, 40, &refund_count)) {
    return Fail(error, "truncated snapshot");
  }
  std::optional<consensus::RefundKey> previous_key;
  for (std::uint64_t i = 0; i < refund_count; ++i) {
    consensus::RefundKey key;
    if (!ser::ReadAddress(body, &offset, &key.refunder) ||
        !ser::ReadAddress(body, &offset, &key.recipient)) {
      return Fail(error, "truncated snapshot");
    }
    if (previous_key && !KeyLess(*previous_key, key)) {
      return Fail(error, "duplicate or unordered claim record");
    }
    previous_key = key;
    state->MarkRefunded(key.refunder, key.recipient);
  }

  if (offset != body.size()) {
    return Fail(error, "trailing bytes in snapshot");
  }
  state->DiscardJournal();
  return true;
}

}  // namespace

bool SaveLedgerSnapshot(const consensus::RefundState& state, const std::string& path,
                        std::string* error) {
  const auto bytes = Serialize(state);
  return util::AtomicWriteFileBytes(std::filesystem::path(path),
                                    std::span<const std::uint8_t>(bytes.data(), bytes.size()),
                                    error);
}

bool LoadLedgerSnapshot(consensus::RefundState* state, const std::string& path,
                        std::string* error) {
  if (!state) {
    return Fail(error, "no state to load into");
  }
  std::vector<std::uint8_t> data;
  if (!util::ReadFileBytes(std::filesystem::path(path), &data, error)) {
    return false;
  }
  if (data.size() < kChecksumSize) {
    return Fail(error, "truncated snapshot");
  }
  const std::size_t body_size = data.size() - kChecksumSize;
  const auto actual = crypto::Sha3_256(std::span<const std::uint8_t>(data.data(), body_size));
  if (!std::equal(actual.begin(), actual.end(), data.begin() + static_cast<std::ptrdiff_t>(body_size))) {
    return Fail(error, "snapshot checksum mismatch");
  }
  data.resize(body_size);

  consensus::RefundState loaded;
  if (!Deserialize(data, &loaded, error)) {
    return false;
  }
  *state = std::move(loaded);
  return true;
}

}  // namespace refundledger::storage
