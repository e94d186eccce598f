#pragma once

#include <cstdint>
#include <vector>

#include "merkla/common.hpp"
#include "merkla/error.hpp"
#include "merkla/options.hpp"

namespace Merkla::MerkleTree {

// sibling 相对于当前路径节点的位置
enum class Position : std::uint8_t {
    Left,
    Right
};

struct ProofStep {
    Bytes sibling;
    Position position;

    bool operator==(const ProofStep&) const = default;
};

// 从叶子层到根的下一层，每层一个 step
using Proof = std::vector<ProofStep>;

/// Recomputes the root from `leaf_hash` along `proof` and compares it with `root_hash`.
///
/// Does not need the tree, only byte values. A proof that is well formed but leads to a
/// different root (including a root or leaf of the wrong length) yields `false`.
/// Structurally invalid steps (empty sibling, unknown position) fail with
/// Errc::InvalidProof; a failing hash function with Errc::HashFailure.
///
/// `ordering` must match the ordering the tree was built with.
[[nodiscard]]
Result<bool> verify(BytesSpan leaf_hash, const Proof& proof, BytesSpan root_hash,
    const Hashing::HashFunction& hash_function,
    PairOrdering ordering = PairOrdering::Positional);

[[nodiscard]] std::string_view to_string(Position position) noexcept;

} // namespace Merkla::MerkleTree
