#include "merkla/merkle_tree.hpp"
#include "merkla/proof.hpp"

#include <algorithm>
#include <glog/logging.h>
#include <utility>

namespace Merkla::MerkleTree {

std::string_view to_string(Position position) noexcept
{
    switch (position) {
    case Position::Left:
        return "left";
    case Position::Right:
        return "right";
    }
    return "invalid";
}

Result<Proof> Tree::prove(size_t leaf_index) const
{
    if (leaf_index >= leaf_count()) {
        // 越界错误
        return std::unexpected(make_error(Errc::IndexOutOfRange, leaf_index,
            "leaf count is " + std::to_string(leaf_count())));
    }

    Proof proof;
    proof.reserve(depth() - 1);

    size_t idx = leaf_index;
    for (size_t level = 0; level + 1 < levels_.size(); ++level) {
        const Level& nodes = levels_[level];
        const bool is_right_node = (idx & 1) != 0;
        // idx^1 是兄弟节点；奇数层的最后一个节点没有兄弟，与自己配对
        const size_t sibling = idx ^ 1;
        const Bytes& sibling_hash = sibling < nodes.size() ? nodes[sibling] : nodes[idx];

        proof.push_back(ProofStep {
            .sibling = sibling_hash,
            .position = is_right_node ? Position::Left : Position::Right });

        idx >>= 1; // 上移一层
    }

    return proof;
}

Result<bool> Tree::verify(BytesSpan leaf_hash, const Proof& proof) const
{
    return MerkleTree::verify(leaf_hash, proof, root(), options_.hash_function, options_.ordering);
}

Result<bool> verify(BytesSpan leaf_hash, const Proof& proof, BytesSpan root_hash,
    const Hashing::HashFunction& hash_function, PairOrdering ordering)
{
    if (!hash_function) {
        return std::unexpected(make_error(Errc::HashFailure, "no hash function configured"));
    }

    // 先检查结构，畸形的 step 直接报错而不是返回 false；build 不会产生空哈希
    for (size_t i = 0; i < proof.size(); ++i) {
        const auto& step = proof[i];
        if (step.sibling.empty()) {
            return std::unexpected(make_error(Errc::InvalidProof, i, "proof sibling is empty"));
        }
        if (step.position != Position::Left && step.position != Position::Right) {
            return std::unexpected(make_error(Errc::InvalidProof, i,
                R"(proof position must be either "left" or "right")"));
        }
    }

    Bytes acc(leaf_hash.begin(), leaf_hash.end());
    for (size_t i = 0; i < proof.size(); ++i) {
        const auto& step = proof[i];
        auto next = step.position == Position::Left
            ? detail::hash_internal(hash_function, ordering, step.sibling, acc)
            : detail::hash_internal(hash_function, ordering, acc, step.sibling);
        if (!next) {
            VLOG(1) << "hashing proof step " << i << " failed: " << next.error().detail;
            return std::unexpected(make_error(Errc::HashFailure, i, std::move(next.error().detail)));
        }
        acc = std::move(*next);
    }

    return std::ranges::equal(acc, root_hash);
}

} // namespace Merkla::MerkleTree
