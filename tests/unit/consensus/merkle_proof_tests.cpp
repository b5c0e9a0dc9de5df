#include <array>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "consensus/merkle_proof.hpp"
#include "crypto/hash.hpp"
#include "tests/unit/util/merkle_builder.hpp"
#include "util/hex.hpp"

int main() {
  using namespace refundledger;
  using test::MakeAddress;
  using test::MerkleBuilder;

  // FIPS-202 known answer for the empty message.
  const auto empty_digest = crypto::Sha3_256(std::span<const std::uint8_t>());
  if (util::HexEncode(empty_digest) !=
      "a7ffc6f8bf1ed76651c14756a061d662f580ff4de43b49fa82d80a4b80f8434a") {
    std::cerr << "SHA3-256(\"\") mismatch\n";
    return EXIT_FAILURE;
  }

  const auto a = MakeAddress(0xA1);
  const auto b = MakeAddress(0xB2);
  const auto leaf_a = consensus::LeafHash(a);
  const auto leaf_b = consensus::LeafHash(b);
  if (leaf_a != crypto::Sha3_256(std::span<const std::uint8_t>(a.data(), a.size()))) {
    std::cerr << "leaf hash is not SHA3-256 of the address bytes\n";
    return EXIT_FAILURE;
  }
  if (consensus::HashSortedPair(leaf_a, leaf_b) != consensus::HashSortedPair(leaf_b, leaf_a)) {
    std::cerr << "pair hash depends on argument order\n";
    return EXIT_FAILURE;
  }

  // A single-leaf tree has the leaf as root and an empty proof.
  if (!consensus::VerifyMerkleProof(leaf_a, {}, leaf_a)) {
    std::cerr << "single-leaf root rejected\n";
    return EXIT_FAILURE;
  }
  if (consensus::VerifyMerkleProof(leaf_a, {}, leaf_b)) {
    std::cerr << "wrong leaf accepted against single-leaf root\n";
    return EXIT_FAILURE;
  }

  std::vector<primitives::Address> recipients;
  for (std::uint8_t tag = 1; tag <= 7; ++tag) {
    recipients.push_back(MakeAddress(tag));
  }
  const MerkleBuilder tree(recipients);
  const auto root = tree.Root();
  for (std::size_t i = 0; i < recipients.size(); ++i) {
    const auto proof = tree.Proof(i);
    if (!consensus::VerifyMerkleProof(root, proof, consensus::LeafHash(recipients[i]))) {
      std::cerr << "valid proof rejected for leaf " << i << "\n";
      return EXIT_FAILURE;
    }
    if (consensus::ComputeRootFromProof(consensus::LeafHash(recipients[i]), proof) != root) {
      std::cerr << "computed root mismatch for leaf " << i << "\n";
      return EXIT_FAILURE;
    }
  }

  // Proof for one recipient does not verify another.
  const auto proof0 = tree.Proof(0);
  if (consensus::VerifyMerkleProof(root, proof0, consensus::LeafHash(recipients[1]))) {
    std::cerr << "proof accepted for the wrong recipient\n";
    return EXIT_FAILURE;
  }
  if (consensus::VerifyMerkleProof(root, proof0, consensus::LeafHash(MakeAddress(0x99)))) {
    std::cerr << "proof accepted for a non-member\n";
    return EXIT_FAILURE;
  }

  // Any tampered sibling breaks the proof.
  auto tampered = proof0;
  tampered.back()[5] ^= 0x01;
  if (consensus::VerifyMerkleProof(root, tampered, consensus::LeafHash(recipients[0]))) {
    std::cerr << "tampered proof accepted\n";
    return EXIT_FAILURE;
  }
  auto truncated = proof0;
  truncated.pop_back();
  if (consensus::VerifyMerkleProof(root, truncated, consensus::LeafHash(recipients[0]))) {
    std::cerr << "truncated proof accepted\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
