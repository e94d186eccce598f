#pragma once

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "merkla/common.hpp"
#include "merkla/error.hpp"
#include "merkla/options.hpp"
#include "merkla/proof.hpp"

namespace Merkla::MerkleTree {

// levels[0] 是叶子哈希，levels.back() 只有一个元素（根）
// 父节点索引 = i / 2，不保存子到父的指针
class Tree {
public:
    using Level = std::vector<Bytes>;

    [[nodiscard]] const Bytes& root() const { return levels_.back().front(); }
    [[nodiscard]] size_t leaf_count() const { return levels_.front().size(); }
    // 层数，单叶子树为 1
    [[nodiscard]] size_t depth() const { return levels_.size(); }

    [[nodiscard]] Result<Bytes> leaf(size_t index) const;
    [[nodiscard]] const Level& leaves() const { return levels_.front(); }
    [[nodiscard]] const std::vector<Level>& levels() const { return levels_; }
    [[nodiscard]] const TreeOptions& options() const { return options_; }

    // 生成证明
    [[nodiscard]] Result<Proof> prove(size_t leaf_index) const;

    // 用本树的哈希函数、拼接方式和根验证
    [[nodiscard]] Result<bool> verify(BytesSpan leaf_hash, const Proof& proof) const;

    /// Restores a tree from previously computed levels without rehashing anything.
    /// Only the shape is checked: non-empty levels, each level ceil(n/2) of the one
    /// below, a single root. Violations fail with Errc::MalformedSerialization.
    [[nodiscard]] static Result<Tree> from_levels(std::vector<Level> levels, TreeOptions options = {});

private:
    Tree(std::vector<Level> levels, TreeOptions options);

    friend Result<Tree> build(std::span<const Bytes> leaves, const TreeOptions& options);

    std::vector<Level> levels_;
    TreeOptions options_;
};

/// Hashes every leaf once and pairs levels upward until a single root remains.
/// An odd last node is paired with itself.
/// Fails with Errc::EmptyInput for no leaves, Errc::HashFailure if the hash function
/// fails (the error carries the leaf index for leaf hashing).
[[nodiscard]]
Result<Tree> build(std::span<const Bytes> leaves, const TreeOptions& options = {});

// 文本叶子按 UTF-8 字节哈希
[[nodiscard]]
Result<Tree> build(std::span<const std::string> leaves, const TreeOptions& options = {});

namespace detail {
    // 空的 hash_function、抛出的异常、错误返回和空摘要都报告为 HashFailure
    Result<Bytes> hash_leaf(const Hashing::HashFunction& hash_function, BytesSpan data);

    // Positional: H(left || right)；Sorted: 先排序再拼接
    Result<Bytes> hash_internal(const Hashing::HashFunction& hash_function, PairOrdering ordering,
        BytesSpan left, BytesSpan right);
}

} // namespace Merkla::MerkleTree
