#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace refundledger::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

// FIPS-202 SHA3-256 backed by liboqs.
Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);

}  // namespace refundledger::crypto
