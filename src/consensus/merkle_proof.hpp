#pragma once

#include <span>

#include "primitives/address.hpp"
#include "primitives/hash.hpp"

namespace refundledger::consensus {

// Leaf committed for an eligible recipient: SHA3-256 over the 20 raw
// address bytes.
primitives::Hash256 LeafHash(const primitives::Address& account);

// SHA3-256(min(a, b) || max(a, b)). Byte-wise comparison, so sibling order
// never has to be carried in the proof.
primitives::Hash256 HashSortedPair(const primitives::Hash256& a, const primitives::Hash256& b);

// Fold `proof` (siblings from leaf level upwards) into a root.
primitives::Hash256 ComputeRootFromProof(const primitives::Hash256& leaf,
                                         std::span<const primitives::Hash256> proof);

bool VerifyMerkleProof(const primitives::Hash256& root,
                       std::span<const primitives::Hash256> proof,
                       const primitives::Hash256& leaf);

}  // namespace refundledger::consensus
