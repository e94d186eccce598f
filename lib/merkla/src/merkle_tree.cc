#include "merkla/merkle_tree.hpp"

#include <algorithm>
#include <bit>
#include <exception>
#include <glog/logging.h>
#include <utility>

namespace Merkla::MerkleTree {

namespace {

    size_t parent_level_size(size_t n)
    {
        return (n + 1) / 2;
    }

    Result<Bytes> invoke_hash(const Hashing::HashFunction& hash_function, BytesSpan data)
    {
        if (!hash_function) {
            return std::unexpected(make_error(Errc::HashFailure, "no hash function configured"));
        }

        std::expected<Bytes, std::error_code> out;
        try {
            out = hash_function(data);
        } catch (const std::exception& e) {
            return std::unexpected(make_error(Errc::HashFailure, e.what()));
        }
        if (!out) {
            return std::unexpected(make_error(Errc::HashFailure, out.error().message()));
        }
        // 空摘要无法作为 proof 的 sibling，也无法序列化
        if (out->empty()) {
            return std::unexpected(make_error(Errc::HashFailure, "hash function returned an empty digest"));
        }
        return *std::move(out);
    }

} // namespace

namespace detail {

    Result<Bytes> hash_leaf(const Hashing::HashFunction& hash_function, BytesSpan data)
    {
        return invoke_hash(hash_function, data);
    }

    Result<Bytes> hash_internal(const Hashing::HashFunction& hash_function, PairOrdering ordering,
        BytesSpan left, BytesSpan right)
    {
        if (ordering == PairOrdering::Sorted
            && std::ranges::lexicographical_compare(right, left)) {
            std::swap(left, right);
        }

        Bytes buf;
        buf.reserve(left.size() + right.size());
        buf.insert(buf.end(), left.begin(), left.end());
        buf.insert(buf.end(), right.begin(), right.end());
        return invoke_hash(hash_function, buf);
    }

} // namespace detail

Tree::Tree(std::vector<Level> levels, TreeOptions options)
    : levels_(std::move(levels))
    , options_(std::move(options))
{
}

Result<Bytes> Tree::leaf(size_t index) const
{
    if (index >= leaf_count()) {
        return std::unexpected(make_error(Errc::IndexOutOfRange, index,
            "leaf count is " + std::to_string(leaf_count())));
    }
    return levels_.front()[index];
}

Result<Tree> Tree::from_levels(std::vector<Level> levels, TreeOptions options)
{
    const auto malformed = [](std::string detail) {
        VLOG(1) << "rejecting tree levels: " << detail;
        return std::unexpected(make_error(Errc::MalformedSerialization, std::move(detail)));
    };

    if (levels.empty() || levels.front().empty()) {
        return malformed("tree must contain at least one leaf");
    }
    for (size_t i = 0; i + 1 < levels.size(); ++i) {
        if (levels[i].size() == 1) {
            return malformed("tree level " + std::to_string(i) + " already holds the root");
        }
        if (levels[i + 1].size() != parent_level_size(levels[i].size())) {
            return malformed("tree level " + std::to_string(i + 1) + " has "
                + std::to_string(levels[i + 1].size()) + " entries, expected "
                + std::to_string(parent_level_size(levels[i].size())));
        }
    }
    if (levels.back().size() != 1) {
        return malformed("last tree level must hold exactly one root");
    }

    return Tree(std::move(levels), std::move(options));
}

Result<Tree> build(std::span<const Bytes> leaves, const TreeOptions& options)
{
    if (leaves.empty()) {
        return std::unexpected(make_error(Errc::EmptyInput));
    }
    if (!options.hash_function) {
        return std::unexpected(make_error(Errc::HashFailure, "no hash function configured"));
    }

    std::vector<Tree::Level> levels;
    levels.reserve(static_cast<size_t>(std::bit_width(leaves.size())) + 1);

    // 1. 每个叶子只哈希一次
    Tree::Level current;
    current.reserve(leaves.size());
    for (size_t i = 0; i < leaves.size(); ++i) {
        auto h = detail::hash_leaf(options.hash_function, leaves[i]);
        if (!h) {
            VLOG(1) << "hashing leaf " << i << " failed: " << h.error().detail;
            return std::unexpected(make_error(Errc::HashFailure, i, std::move(h.error().detail)));
        }
        current.push_back(std::move(*h));
    }

    // 2. 逐层向上，奇数个时最后一个与自己配对
    while (current.size() > 1) {
        Tree::Level next;
        next.reserve(parent_level_size(current.size()));
        for (size_t i = 0; i < current.size(); i += 2) {
            const Bytes& left = current[i];
            const Bytes& right = (i + 1 < current.size()) ? current[i + 1] : current[i];
            auto h = detail::hash_internal(options.hash_function, options.ordering, left, right);
            if (!h) {
                VLOG(1) << "hashing level " << levels.size() + 1 << " node " << i / 2
                        << " failed: " << h.error().detail;
                return std::unexpected(make_error(Errc::HashFailure,
                    "internal node " + std::to_string(i / 2) + " of level "
                        + std::to_string(levels.size() + 1) + ": " + h.error().detail));
            }
            next.push_back(std::move(*h));
        }
        VLOG(2) << "level " << levels.size() << ": " << current.size() << " nodes";
        levels.push_back(std::move(current));
        current = std::move(next);
    }
    levels.push_back(std::move(current));

    VLOG(1) << "built merkle tree: " << leaves.size() << " leaves, depth " << levels.size();
    return Tree(std::move(levels), options);
}

Result<Tree> build(std::span<const std::string> leaves, const TreeOptions& options)
{
    std::vector<Bytes> raw;
    raw.reserve(leaves.size());
    for (const auto& s : leaves) {
        raw.push_back(to_bytes(s));
    }
    return build(std::span<const Bytes>(raw), options);
}

} // namespace Merkla::MerkleTree
