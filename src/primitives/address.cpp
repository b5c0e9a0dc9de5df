#include "primitives/address.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "util/hex.hpp"

namespace refundledger::primitives {

std::string AddressToHex(const Address& address) {
  return "0x" +
         util::HexEncode(std::span<const std::uint8_t>(address.data(), address.size()));
}

bool ParseAddress(std::string_view text, Address* out) {
  if (!out) {
    return false;
  }
  const std::string_view digits = util::StripHexPrefix(text);
  if (digits.size() != out->size() * 2) {
    return false;
  }
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(digits, &bytes)) {
    return false;
  }
  std::copy(bytes.begin(), bytes.end(), out->begin());
  return true;
}

}  // namespace refundledger::primitives
