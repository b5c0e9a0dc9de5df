#include "primitives/amount.hpp"

#include <algorithm>

namespace refundledger::primitives {

namespace {

using Bytes256 = std::array<std::uint8_t, 32>;

bool BytesAreZero(const Bytes256& value) {
  for (auto b : value) {
    if (b != 0) return false;
  }
  return true;
}

// In-place big-endian division by a small divisor; returns the remainder.
std::uint32_t DivideBy(Bytes256* value, std::uint32_t divisor) {
  std::uint64_t remainder = 0;
  for (std::size_t i = 0; i < value->size(); ++i) {
    const std::uint64_t current = (remainder << 8) | (*value)[i];
    (*value)[i] = static_cast<std::uint8_t>(current / divisor);
    remainder = current % divisor;
  }
  return static_cast<std::uint32_t>(remainder);
}

// value = value * factor + addend. Returns false when the result needs more
// than 256 bits.
bool MultiplyAdd(Bytes256* value, std::uint32_t factor, std::uint32_t addend) {
  std::uint64_t carry = addend;
  for (int i = static_cast<int>(value->size()) - 1; i >= 0; --i) {
    const std::uint64_t current =
        static_cast<std::uint64_t>((*value)[static_cast<std::size_t>(i)]) * factor + carry;
    (*value)[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(current & 0xFFu);
    carry = current >> 8;
  }
  return carry == 0;
}

}  // namespace

std::string Amount::ToString() const {
  Bytes256 value = ToBigEndian();
  if (BytesAreZero(value)) {
    return "0";
  }
  std::string digits;
  digits.reserve(78);
  while (!BytesAreZero(value)) {
    const std::uint32_t digit = DivideBy(&value, 10);
    digits.push_back(static_cast<char>('0' + digit));
  }
  std::reverse(digits.begin(), digits.end());
  return digits;
}

bool ParseAmount(std::string_view text, Amount* out) {
  if (text.empty()) {
    return false;
  }
  Bytes256 value{};
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    if (!MultiplyAdd(&value, 10, static_cast<std::uint32_t>(c - '0'))) {
      return false;
    }
  }
  if (out) {
    *out = Amount::FromBigEndian(value);
  }
  return true;
}

}  // namespace refundledger::primitives
