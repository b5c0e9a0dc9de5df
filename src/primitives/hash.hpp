#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace refundledger::primitives {

using Hash256 = std::array<std::uint8_t, 32>;

struct Hash256Hasher {
  std::size_t operator()(const Hash256& hash) const noexcept {
    std::size_t result = 0;
    for (auto byte : hash) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

// Lowercase hex with a "0x" prefix.
std::string HashToHex(const Hash256& hash);

// Accepts 64 hex digits with an optional "0x" prefix.
bool ParseHash256(std::string_view text, Hash256* out);

}  // namespace refundledger::primitives
