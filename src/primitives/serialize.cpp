#include "primitives/serialize.hpp"

#include <algorithm>
#include <array>

namespace refundledger::primitives::serialize {

namespace {

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

}  // namespace

void WriteUint16(std::vector<std::uint8_t>* out, std::uint16_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  out->push_back(static_cast<std::uint8_t>(value & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    WriteUint16(out, static_cast<std::uint16_t>(value));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data) {
  out->insert(out->end(), data.begin(), data.end());
}

void WriteHash(std::vector<std::uint8_t>* out, const Hash256& hash) {
  WriteBytes(out, std::span<const std::uint8_t>(hash.data(), hash.size()));
}

void WriteAddress(std::vector<std::uint8_t>* out, const Address& address) {
  WriteBytes(out, std::span<const std::uint8_t>(address.data(), address.size()));
}

void WriteAmount(std::vector<std::uint8_t>* out, const Amount& amount) {
  const auto bytes = amount.ToBigEndian();
  WriteBytes(out, std::span<const std::uint8_t>(bytes.data(), bytes.size()));
}

bool ReadUint16(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint16_t* value) {
  if (!Require(data, *offset, 2)) return false;
  *value = static_cast<std::uint16_t>(data[*offset] |
                                      (static_cast<std::uint16_t>(data[*offset + 1]) << 8));
  *offset += 2;
  return true;
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(data[*offset]) |
           (static_cast<std::uint32_t>(data[*offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[*offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[*offset + 3]) << 24);
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + static_cast<std::size_t>(i)]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    std::uint16_t tmp = 0;
    if (!ReadUint16(data, offset, &tmp)) return false;
    if (tmp < 0xFD) {
      return false;
    }
    *value = tmp;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp)) return false;
    if (tmp <= 0xFFFFu) {
      return false;
    }
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp)) return false;
  if (tmp <= 0xFFFFFFFFULL) {
    return false;
  }
  *value = tmp;
  return true;
}

bool ReadBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
               std::span<std::uint8_t> out) {
  if (!Require(data, *offset, out.size())) return false;
  std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(*offset), out.size(), out.begin());
  *offset += out.size();
  return true;
}

bool ReadHash(const std::vector<std::uint8_t>& data, std::size_t* offset, Hash256* hash) {
  return ReadBytes(data, offset, std::span<std::uint8_t>(hash->data(), hash->size()));
}

bool ReadAddress(const std::vector<std::uint8_t>& data, std::size_t* offset, Address* address) {
  return ReadBytes(data, offset, std::span<std::uint8_t>(address->data(), address->size()));
}

bool ReadAmount(const std::vector<std::uint8_t>& data, std::size_t* offset, Amount* amount) {
  std::array<std::uint8_t, 32> bytes{};
  if (!ReadBytes(data, offset, std::span<std::uint8_t>(bytes.data(), bytes.size()))) {
    return false;
  }
  *amount = Amount::FromBigEndian(bytes);
  return true;
}

}  // namespace refundledger::primitives::serialize
