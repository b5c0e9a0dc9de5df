#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>

namespace refundledger::primitives {

// Unsigned 256-bit value. Arithmetic is only exposed through the checked
// helpers below so balances can never wrap.
class Amount {
 public:
  Amount() = default;
  explicit Amount(std::uint64_t value) { limbs_[0] = value; }

  static Amount Zero() { return Amount(); }

  static Amount Max() {
    Amount amount;
    amount.limbs_.fill(std::numeric_limits<std::uint64_t>::max());
    return amount;
  }

  static Amount FromBigEndian(std::span<const std::uint8_t, 32> bytes) {
    Amount amount;
    for (std::size_t i = 0; i < bytes.size(); ++i) {
      const std::uint8_t byte = bytes[bytes.size() - 1 - i];
      const std::size_t limb = i / 8;
      const std::size_t shift = (i % 8) * 8;
      amount.limbs_[limb] |= static_cast<std::uint64_t>(byte) << shift;
    }
    return amount;
  }

  std::array<std::uint8_t, 32> ToBigEndian() const {
    std::array<std::uint8_t, 32> out{};
    for (std::size_t i = 0; i < out.size(); ++i) {
      const std::size_t limb = i / 8;
      const std::size_t shift = (i % 8) * 8;
      out[out.size() - 1 - i] = static_cast<std::uint8_t>((limbs_[limb] >> shift) & 0xFFu);
    }
    return out;
  }

  bool IsZero() const {
    for (auto limb : limbs_) {
      if (limb != 0) return false;
    }
    return true;
  }

  friend bool operator==(const Amount& lhs, const Amount& rhs) {
    return lhs.limbs_ == rhs.limbs_;
  }

  friend bool operator!=(const Amount& lhs, const Amount& rhs) { return !(lhs == rhs); }

  friend bool operator<(const Amount& lhs, const Amount& rhs) {
    for (std::size_t i = lhs.limbs_.size(); i-- > 0;) {
      if (lhs.limbs_[i] < rhs.limbs_[i]) return true;
      if (lhs.limbs_[i] > rhs.limbs_[i]) return false;
    }
    return false;
  }

  friend bool operator>(const Amount& lhs, const Amount& rhs) { return rhs < lhs; }

  friend bool operator<=(const Amount& lhs, const Amount& rhs) { return !(rhs < lhs); }

  friend bool operator>=(const Amount& lhs, const Amount& rhs) { return !(lhs < rhs); }

  // Decimal rendering, no leading zeros ("0" for zero).
  std::string ToString() const;

 private:
  std::array<std::uint64_t, 4> limbs_{};

  friend bool CheckedAdd(const Amount& a, const Amount& b, Amount* out) noexcept;
  friend bool CheckedSub(const Amount& a, const Amount& b, Amount* out) noexcept;
  friend bool ParseAmount(std::string_view text, Amount* out);
};

inline bool CheckedAdd(const Amount& a, const Amount& b, Amount* out) noexcept {
  Amount sum;
  std::uint64_t carry = 0;
  for (std::size_t i = 0; i < sum.limbs_.size(); ++i) {
    const std::uint64_t partial = a.limbs_[i] + b.limbs_[i];
    const std::uint64_t carry1 = partial < a.limbs_[i] ? 1 : 0;
    const std::uint64_t partial2 = partial + carry;
    const std::uint64_t carry2 = partial2 < partial ? 1 : 0;
    sum.limbs_[i] = partial2;
    carry = carry1 | carry2;
  }
  if (carry != 0) {
    return false;
  }
  if (out) {
    *out = sum;
  }
  return true;
}

inline bool CheckedSub(const Amount& a, const Amount& b, Amount* out) noexcept {
  if (b > a) {
    return false;
  }
  Amount diff;
  std::uint64_t borrow = 0;
  for (std::size_t i = 0; i < diff.limbs_.size(); ++i) {
    const std::uint64_t partial = a.limbs_[i] - b.limbs_[i];
    const std::uint64_t borrow1 = a.limbs_[i] < b.limbs_[i] ? 1 : 0;
    const std::uint64_t partial2 = partial - borrow;
    const std::uint64_t borrow2 = partial < borrow ? 1 : 0;
    diff.limbs_[i] = partial2;
    borrow = borrow1 | borrow2;
  }
  if (out) {
    *out = diff;
  }
  return true;
}

// Parses a base-10 string of digits. Rejects empty input, signs, separators
// and values above Amount::Max().
bool ParseAmount(std::string_view text, Amount* out);

}  // namespace refundledger::primitives
