#include "merkla/merkle_tree.hpp"
#include "merkle_test_utils.hpp"
#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>

namespace Merkla::MerkleTree {

class MerkleTreeTest : public ::testing::Test {
protected:
    std::vector<Bytes> abcd;

    void SetUp() override
    {
        abcd = to_leaves({ "a", "b", "c", "d" });
    }
};

TEST_F(MerkleTreeTest, BuildEmptyFails)
{
    std::vector<Bytes> empty_leaves;
    auto tree = build(empty_leaves);

    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, Errc::EmptyInput);
}

TEST_F(MerkleTreeTest, SingleLeaf)
{
    std::vector<Bytes> leaves = { to_bytes("only") };
    auto tree = build(leaves);
    ASSERT_TRUE(tree.has_value());

    EXPECT_EQ(tree->leaf_count(), 1U);
    EXPECT_EQ(tree->depth(), 1U);
    // 单叶子树不做内部哈希，根就是叶子哈希
    EXPECT_EQ(tree->root(), sha256_of("only"));
}

TEST_F(MerkleTreeTest, FourLeavesKnownRoot)
{
    auto tree = build(abcd);
    ASSERT_TRUE(tree.has_value());

    ASSERT_EQ(tree->depth(), 3U);
    EXPECT_EQ(tree->levels()[0].size(), 4U);
    EXPECT_EQ(tree->levels()[1].size(), 2U);
    EXPECT_EQ(tree->levels()[2].size(), 1U);

    EXPECT_EQ(tree->leaves()[0], from_hex("ca978112ca1bbdcafac231b39a23dc4da786eff8147c4e72b9807785afee48bb"));
    EXPECT_EQ(tree->levels()[1][0], from_hex("e5a01fee14e0ed5c48714f22180f25ad8365b53f9779f79dc4a3d7e93963f94a"));
    EXPECT_EQ(tree->root(), from_hex("14ede5e8e97ad9372327728f5099b95604a39593cac3bd38a343ad76205213e7"));
}

TEST_F(MerkleTreeTest, RootMatchesManualComputation)
{
    auto tree = build(abcd);
    ASSERT_TRUE(tree.has_value());

    const auto ab = sha256_of(concat(sha256_of("a"), sha256_of("b")));
    const auto cd = sha256_of(concat(sha256_of("c"), sha256_of("d")));
    EXPECT_EQ(tree->root(), sha256_of(concat(ab, cd)));
}

// 3 个叶子：(a,b) 和 (c,c)
TEST_F(MerkleTreeTest, OddNumberOfLeavesSelfPairs)
{
    auto leaves = to_leaves({ "a", "b", "c" });
    auto tree = build(leaves);
    ASSERT_TRUE(tree.has_value());

    ASSERT_EQ(tree->depth(), 3U);
    EXPECT_EQ(tree->levels()[0].size(), 3U);
    ASSERT_EQ(tree->levels()[1].size(), 2U);
    EXPECT_EQ(tree->levels()[2].size(), 1U);

    const auto c = sha256_of("c");
    EXPECT_EQ(tree->levels()[1][1], sha256_of(concat(c, c)));
    EXPECT_EQ(tree->root(), from_hex("d31a37ef6ac14a2db1470c4316beb5592e6afd4465022339adafda76a18ffabe"));
}

TEST_F(MerkleTreeTest, LevelSizesHalveRoundingUp)
{
    for (size_t n = 1; n <= 40; ++n) {
        std::vector<Bytes> leaves;
        for (size_t i = 0; i < n; ++i) {
            leaves.push_back(to_bytes("leaf_" + std::to_string(i)));
        }
        auto tree = build(leaves);
        ASSERT_TRUE(tree.has_value());

        const auto& levels = tree->levels();
        for (size_t l = 0; l + 1 < levels.size(); ++l) {
            EXPECT_EQ(levels[l + 1].size(), (levels[l].size() + 1) / 2) << "n=" << n << " level=" << l;
        }
        EXPECT_EQ(levels.back().size(), 1U);

        size_t expected_depth = n == 1 ? 1 : static_cast<size_t>(std::ceil(std::log2(static_cast<double>(n)))) + 1;
        EXPECT_EQ(tree->depth(), expected_depth) << "n=" << n;
    }
}

TEST_F(MerkleTreeTest, Deterministic)
{
    auto t1 = build(abcd);
    auto t2 = build(abcd);
    ASSERT_TRUE(t1.has_value());
    ASSERT_TRUE(t2.has_value());

    EXPECT_EQ(t1->root(), t2->root());
    EXPECT_EQ(t1->levels(), t2->levels());
}

TEST_F(MerkleTreeTest, TextAndByteLeavesAgree)
{
    std::vector<std::string> text = { "a", "b", "c", "d" };
    auto from_text = build(text);
    auto from_bytes = build(abcd);
    ASSERT_TRUE(from_text.has_value());
    ASSERT_TRUE(from_bytes.has_value());

    EXPECT_EQ(from_text->root(), from_bytes->root());
}

TEST_F(MerkleTreeTest, LeafOrderMatters)
{
    auto reversed = to_leaves({ "d", "c", "b", "a" });
    auto t1 = build(abcd);
    auto t2 = build(reversed);
    ASSERT_TRUE(t1.has_value());
    ASSERT_TRUE(t2.has_value());

    EXPECT_NE(t1->root(), t2->root());
}

TEST_F(MerkleTreeTest, LeafAccessors)
{
    auto tree = build(abcd);
    ASSERT_TRUE(tree.has_value());

    auto leaf = tree->leaf(2);
    ASSERT_TRUE(leaf.has_value());
    EXPECT_EQ(*leaf, sha256_of("c"));
    EXPECT_EQ(tree->leaves().size(), 4U);
    EXPECT_EQ(tree->leaves()[3], sha256_of("d"));

    auto out_of_range = tree->leaf(4);
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, Errc::IndexOutOfRange);
    EXPECT_EQ(out_of_range.error().index, 4U);
}

TEST_F(MerkleTreeTest, AlgorithmSelectsDigestSize)
{
    auto tree = build(abcd, TreeOptions::with_algorithm(Hashing::HashAlgorithm::Sha512));
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->root().size(), 64U);

    auto md5_tree = build(abcd, TreeOptions::with_algorithm(Hashing::HashAlgorithm::Md5));
    ASSERT_TRUE(md5_tree.has_value());
    EXPECT_EQ(md5_tree->root().size(), 16U);
}

TEST_F(MerkleTreeTest, CustomHashFunction)
{
    // 只取输入前两个字节的“哈希”，用于观察拼接顺序
    TreeOptions options {
        .hash_function = [](BytesSpan data) -> std::expected<Bytes, std::error_code> {
            return Bytes(data.begin(), data.begin() + std::min<size_t>(2, data.size()));
        }
    };
    auto leaves = to_leaves({ "xy", "zw" });
    auto tree = build(leaves, options);
    ASSERT_TRUE(tree.has_value());

    EXPECT_EQ(tree->root(), to_bytes("xy"));
}

TEST_F(MerkleTreeTest, SortedPairsChangesRoot)
{
    auto sorted = build(abcd, TreeOptions { .ordering = PairOrdering::Sorted });
    auto positional = build(abcd);
    ASSERT_TRUE(sorted.has_value());
    ASSERT_TRUE(positional.has_value());

    EXPECT_EQ(sorted->root(), from_hex("4c6aae040ffada3d02598207b8485fcbe161c03f4cb3f660e4d341e7496ff3b2"));
    EXPECT_NE(sorted->root(), positional->root());
    EXPECT_EQ(sorted->options().ordering, PairOrdering::Sorted);
}

// 自己和自己排序不改变任何东西
TEST_F(MerkleTreeTest, SortedPairsSelfPairUnchanged)
{
    auto leaves = to_leaves({ "c", "c" });
    auto sorted = build(leaves, TreeOptions { .ordering = PairOrdering::Sorted });
    auto positional = build(leaves);
    ASSERT_TRUE(sorted.has_value());
    ASSERT_TRUE(positional.has_value());
    EXPECT_EQ(sorted->root(), positional->root());

    auto odd = to_leaves({ "x", "y", "z" });
    auto sorted_odd = build(odd, TreeOptions { .ordering = PairOrdering::Sorted });
    auto positional_odd = build(odd);
    ASSERT_TRUE(sorted_odd.has_value());
    ASSERT_TRUE(positional_odd.has_value());
    EXPECT_EQ(sorted_odd->levels()[1][1], positional_odd->levels()[1][1]);
}

TEST_F(MerkleTreeTest, HashFailureReportsLeafIndex)
{
    TreeOptions options {
        .hash_function = [](BytesSpan data) -> std::expected<Bytes, std::error_code> {
            if (data.size() == 3) {
                return std::unexpected(std::make_error_code(std::errc::invalid_argument));
            }
            return Bytes(data.begin(), data.end());
        }
    };
    auto leaves = to_leaves({ "a", "bb", "ccc", "d" });
    auto tree = build(leaves, options);

    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, Errc::HashFailure);
    EXPECT_EQ(tree.error().index, 2U);
}

TEST_F(MerkleTreeTest, HashFailureInInternalNode)
{
    TreeOptions options {
        .hash_function = [](BytesSpan data) -> std::expected<Bytes, std::error_code> {
            if (data.size() > 1) {
                return std::unexpected(std::make_error_code(std::errc::invalid_argument));
            }
            return Bytes(data.begin(), data.end());
        }
    };
    auto leaves = to_leaves({ "a", "b" });
    auto tree = build(leaves, options);

    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, Errc::HashFailure);
    EXPECT_FALSE(tree.error().index.has_value());
    EXPECT_NE(tree.error().message().find("level 1"), std::string::npos);
}

TEST_F(MerkleTreeTest, MissingHashFunctionIsHashFailure)
{
    TreeOptions options { .hash_function = nullptr };
    auto tree = build(abcd, options);

    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, Errc::HashFailure);
}

// 哈希函数抛出的异常不会逃出 build
TEST_F(MerkleTreeTest, ThrowingHashFunctionReportsLeafIndex)
{
    TreeOptions options {
        .hash_function = [](BytesSpan data) -> std::expected<Bytes, std::error_code> {
            if (data.size() == 3) {
                throw std::runtime_error("boom");
            }
            return Bytes(data.begin(), data.end());
        }
    };
    auto tree = build(to_leaves({ "a", "bb", "ccc", "d" }), options);

    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, Errc::HashFailure);
    EXPECT_EQ(tree.error().index, 2U);
    EXPECT_EQ(tree.error().detail, "boom");
}

// Identity 对空叶子给出空摘要，build 拒绝它
TEST_F(MerkleTreeTest, EmptyDigestIsHashFailure)
{
    std::vector<Bytes> leaves = { Bytes {}, to_bytes("a") };
    auto tree = build(leaves, TreeOptions::with_algorithm(Hashing::HashAlgorithm::Identity));

    ASSERT_FALSE(tree.has_value());
    EXPECT_EQ(tree.error().code, Errc::HashFailure);
    EXPECT_EQ(tree.error().index, 0U);

    TreeOptions empty_internal {
        .hash_function = [](BytesSpan data) -> std::expected<Bytes, std::error_code> {
            if (data.size() > 1) {
                return Bytes {};
            }
            return Bytes(data.begin(), data.end());
        }
    };
    auto internal = build(to_leaves({ "a", "b" }), empty_internal);
    ASSERT_FALSE(internal.has_value());
    EXPECT_EQ(internal.error().code, Errc::HashFailure);
    EXPECT_FALSE(internal.error().index.has_value());
}

TEST_F(MerkleTreeTest, FromLevelsChecksShape)
{
    auto tree = build(abcd);
    ASSERT_TRUE(tree.has_value());

    auto restored = Tree::from_levels(tree->levels());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->root(), tree->root());

    auto missing_root = tree->levels();
    missing_root.pop_back();
    auto bad = Tree::from_levels(missing_root);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, Errc::MalformedSerialization);

    auto wrong_size = tree->levels();
    wrong_size[1].push_back(wrong_size[1].front());
    EXPECT_FALSE(Tree::from_levels(wrong_size).has_value());

    EXPECT_FALSE(Tree::from_levels({}).has_value());

    // 根之上不能再有层
    auto extra_level = tree->levels();
    extra_level.push_back(extra_level.back());
    EXPECT_FALSE(Tree::from_levels(extra_level).has_value());
}

TEST_F(MerkleTreeTest, LargeTree)
{
    size_t N = 1000;
    std::vector<Bytes> many_leaves;
    for (size_t i = 0; i < N; ++i) {
        many_leaves.push_back(to_bytes("leaf_" + std::to_string(i)));
    }

    auto tree = build(many_leaves);
    ASSERT_TRUE(tree.has_value());
    EXPECT_EQ(tree->leaf_count(), N);
    EXPECT_EQ(tree->depth(), 11U);
}

} // namespace Merkla::MerkleTree
