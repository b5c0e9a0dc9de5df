#include "consensus/merkle_proof.hpp"

#include <algorithm>
#include <array>

#include "crypto/hash.hpp"

namespace refundledger::consensus {

primitives::Hash256 LeafHash(const primitives::Address& account) {
  return crypto::Sha3_256(std::span<const std::uint8_t>(account.data(), account.size()));
}

primitives::Hash256 HashSortedPair(const primitives::Hash256& a, const primitives::Hash256& b) {
  const primitives::Hash256& left = (b < a) ? b : a;
  const primitives::Hash256& right = (b < a) ? a : b;
  std::array<std::uint8_t, 64> buffer{};
  std::copy(left.begin(), left.end(), buffer.begin());
  std::copy(right.begin(), right.end(), buffer.begin() + left.size());
  return crypto::Sha3_256(std::span<const std::uint8_t>(buffer.data(), buffer.size()));
}

primitives::Hash256 ComputeRootFromProof(const primitives::Hash256& leaf,
                                         std::span<const primitives::Hash256> proof) {
  primitives::Hash256 current = leaf;
  for (const auto& sibling : proof) {
    current = HashSortedPair(current, sibling);
  }
  return current;
}

bool VerifyMerkleProof(const primitives::Hash256& root,
                       std::span<const primitives::Hash256> proof,
                       const primitives::Hash256& leaf) {
  return ComputeRootFromProof(leaf, proof) == root;
}

}  // namespace refundledger::consensus
