#pragma once

#include <cstdint>

#include "merkla/hash.hpp"

namespace Merkla::MerkleTree {

// 父节点哈希时两个子哈希的拼接方式，构建和验证必须一致
enum class PairOrdering : std::uint8_t {
    Positional, // hash(left || right)
    Sorted // 两个子哈希按字节序排序后再拼接
};

struct TreeOptions {
    Hashing::HashFunction hash_function = Hashing::make_hash_function(Hashing::HashAlgorithm::Sha256);
    PairOrdering ordering = PairOrdering::Positional;

    [[nodiscard]] static TreeOptions with_algorithm(Hashing::HashAlgorithm algorithm,
        PairOrdering ordering = PairOrdering::Positional)
    {
        return TreeOptions { .hash_function = Hashing::make_hash_function(algorithm), .ordering = ordering };
    }
};

} // namespace Merkla::MerkleTree
