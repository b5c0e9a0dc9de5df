#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace refundledger::primitives {

// Account principal. Both refunders and recipients are identified by one.
using Address = std::array<std::uint8_t, 20>;

struct AddressHasher {
  std::size_t operator()(const Address& address) const noexcept {
    std::size_t result = 0;
    for (auto byte : address) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

std::string AddressToHex(const Address& address);

// Accepts 40 hex digits with an optional "0x" prefix, any case.
bool ParseAddress(std::string_view text, Address* out);

}  // namespace refundledger::primitives
