#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "primitives/address.hpp"
#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace refundledger::primitives::serialize {

void WriteUint16(std::vector<std::uint8_t>* out, std::uint16_t value);
void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data);
void WriteHash(std::vector<std::uint8_t>* out, const Hash256& hash);
void WriteAddress(std::vector<std::uint8_t>* out, const Address& address);
// Amounts are stored as 32-byte big-endian integers.
void WriteAmount(std::vector<std::uint8_t>* out, const Amount& amount);

bool ReadUint16(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint16_t* value);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
// Rejects non-canonical encodings.
bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::span<std::uint8_t> out);
bool ReadHash(const std::vector<std::uint8_t>& data, std::size_t* offset, Hash256* hash);
bool ReadAddress(const std::vector<std::uint8_t>& data, std::size_t* offset, Address* address);
bool ReadAmount(const std::vector<std::uint8_t>& data, std::size_t* offset, Amount* amount);

}  // namespace refundledger::primitives::serialize
