#include <cstdlib>
#include <iostream>
#include <string>

#include "primitives/amount.hpp"

int main() {
  using refundledger::primitives::Amount;
  using refundledger::primitives::CheckedAdd;
  using refundledger::primitives::CheckedSub;
  using refundledger::primitives::ParseAmount;

  if (Amount::Zero().ToString() != "0" || Amount(120).ToString() != "120") {
    std::cerr << "small amounts rendered incorrectly\n";
    return EXIT_FAILURE;
  }

  const std::string max_text =
      "115792089237316195423570985008687907853269984665640564039457584007913129639935";
  if (Amount::Max().ToString() != max_text) {
    std::cerr << "max amount rendered as " << Amount::Max().ToString() << "\n";
    return EXIT_FAILURE;
  }
  Amount parsed;
  if (!ParseAmount(max_text, &parsed) || parsed != Amount::Max()) {
    std::cerr << "failed to parse max amount\n";
    return EXIT_FAILURE;
  }
  // 2^256 does not fit.
  if (ParseAmount("115792089237316195423570985008687907853269984665640564039457584007913129639936",
                  &parsed)) {
    std::cerr << "2^256 accepted\n";
    return EXIT_FAILURE;
  }
  if (ParseAmount("", &parsed) || ParseAmount("-1", &parsed) || ParseAmount("1e3", &parsed) ||
      ParseAmount("1 000", &parsed)) {
    std::cerr << "malformed decimal accepted\n";
    return EXIT_FAILURE;
  }
  if (!ParseAmount("18446744073709551616", &parsed) ||
      parsed.ToString() != "18446744073709551616") {
    std::cerr << "2^64 did not survive parse/render\n";
    return EXIT_FAILURE;
  }

  // Carry across limbs.
  Amount sum;
  if (!CheckedAdd(Amount(~0ULL), Amount(1), &sum) || sum.ToString() != "18446744073709551616") {
    std::cerr << "limb carry failed\n";
    return EXIT_FAILURE;
  }
  Amount diff;
  if (!CheckedSub(sum, Amount(1), &diff) || diff != Amount(~0ULL)) {
    std::cerr << "limb borrow failed\n";
    return EXIT_FAILURE;
  }

  if (CheckedAdd(Amount::Max(), Amount(1), &sum)) {
    std::cerr << "overflow not detected\n";
    return EXIT_FAILURE;
  }
  if (CheckedSub(Amount(50), Amount(100), &diff)) {
    std::cerr << "underflow not detected\n";
    return EXIT_FAILURE;
  }
  if (!CheckedSub(Amount(120), Amount(100), &diff) || diff != Amount(20)) {
    std::cerr << "120 - 100 != 20\n";
    return EXIT_FAILURE;
  }

  if (!(Amount(20) < Amount(100)) || !(Amount::Max() > Amount(1)) || Amount(5) != Amount(5)) {
    std::cerr << "ordering broken\n";
    return EXIT_FAILURE;
  }
  const auto bytes = sum.ToBigEndian();
  if (Amount::FromBigEndian(bytes) != sum || bytes[23] != 0x01) {
    std::cerr << "big-endian conversion mismatch\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
