#pragma once

#include <string>
#include <string_view>

#include "merkla/error.hpp"
#include "merkla/merkle_tree.hpp"
#include "merkla/proof.hpp"

namespace Merkla::Codec {

// {"leaves":[hex...],"tree":[[hex...],...]}，tree[0] 与 leaves 相同
[[nodiscard]] std::string serialize(const MerkleTree::Tree& tree);

/// Parses the output of serialize().
///
/// Checks the JSON structure, that every hash is a hex string and that the level sizes
/// form a valid tree. Hash values themselves are trusted: nothing is rehashed, so a
/// hand-edited tree is only caught by verifying proofs against a known-good root.
/// Every violation fails with Errc::MalformedSerialization; the detail names the field.
///
/// `options` supplies the hash function and ordering used by later Tree::verify calls.
[[nodiscard]]
Result<MerkleTree::Tree> deserialize(std::string_view text, const MerkleTree::TreeOptions& options = {});

// [{"sibling":hex,"position":"left"|"right"},...]
[[nodiscard]] std::string serialize_proof(const MerkleTree::Proof& proof);

// 结构错误返回 Errc::InvalidProof
[[nodiscard]] Result<MerkleTree::Proof> deserialize_proof(std::string_view text);

} // namespace Merkla::Codec
