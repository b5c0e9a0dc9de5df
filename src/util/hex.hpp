#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace refundledger::util {

std::string HexEncode(std::span<const std::uint8_t> data);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Drops a leading "0x" or "0X" when present.
std::string_view StripHexPrefix(std::string_view text);

}  // namespace refundledger::util
