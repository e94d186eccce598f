#include "merkla/codec.hpp"
#include "merkla/hex.hpp"

#include <glog/logging.h>
#include <nlohmann/json.hpp>
#include <utility>

namespace Merkla::Codec {

using MerkleTree::Position;
using MerkleTree::Proof;
using MerkleTree::ProofStep;
using MerkleTree::Tree;

namespace {

    constexpr const char* LEAVES_KEY = "leaves";
    constexpr const char* TREE_KEY = "tree";
    constexpr const char* SIBLING_KEY = "sibling";
    constexpr const char* POSITION_KEY = "position";

    std::unexpected<Error> malformed(std::string detail)
    {
        VLOG(1) << "deserialize failed: " << detail;
        return std::unexpected(make_error(Errc::MalformedSerialization, std::move(detail)));
    }

    std::unexpected<Error> invalid_proof(std::string detail, std::optional<size_t> step = std::nullopt)
    {
        VLOG(1) << "deserialize_proof failed: " << detail;
        auto err = make_error(Errc::InvalidProof, std::move(detail));
        err.index = step;
        return std::unexpected(std::move(err));
    }

    nlohmann::json hex_array(const Tree::Level& level)
    {
        auto out = nlohmann::json::array();
        for (const auto& h : level) {
            out.push_back(Hex::encode(h));
        }
        return out;
    }

    std::optional<Bytes> decode_hash(const nlohmann::json& value)
    {
        if (!value.is_string()) {
            return std::nullopt;
        }
        return Hex::decode(value.get_ref<const std::string&>());
    }

} // namespace

std::string serialize(const Tree& tree)
{
    nlohmann::json levels = nlohmann::json::array();
    for (const auto& level : tree.levels()) {
        levels.push_back(hex_array(level));
    }

    nlohmann::json doc;
    doc[LEAVES_KEY] = hex_array(tree.leaves());
    doc[TREE_KEY] = std::move(levels);
    return doc.dump();
}

Result<Tree> deserialize(std::string_view text, const MerkleTree::TreeOptions& options)
{
    // 不使用异常：解析失败返回 discarded
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return malformed("text is not valid JSON");
    }
    if (!doc.is_object()) {
        return malformed("serialized tree must be a JSON object");
    }

    const auto leaves_it = doc.find(LEAVES_KEY);
    if (leaves_it == doc.end() || !leaves_it->is_array()) {
        return malformed("leaves must be an array");
    }
    const auto tree_it = doc.find(TREE_KEY);
    if (tree_it == doc.end() || !tree_it->is_array()) {
        return malformed("tree must be an array");
    }

    Tree::Level leaves;
    leaves.reserve(leaves_it->size());
    for (size_t i = 0; i < leaves_it->size(); ++i) {
        auto h = decode_hash((*leaves_it)[i]);
        if (!h) {
            return malformed("invalid hex in leaves entry " + std::to_string(i));
        }
        leaves.push_back(std::move(*h));
    }

    std::vector<Tree::Level> levels;
    levels.reserve(tree_it->size());
    for (size_t l = 0; l < tree_it->size(); ++l) {
        const auto& entry = (*tree_it)[l];
        if (!entry.is_array()) {
            return malformed("tree level " + std::to_string(l) + " must be an array");
        }
        Tree::Level level;
        level.reserve(entry.size());
        for (size_t i = 0; i < entry.size(); ++i) {
            auto h = decode_hash(entry[i]);
            if (!h) {
                return malformed("invalid hex in tree level " + std::to_string(l)
                    + " entry " + std::to_string(i));
            }
            level.push_back(std::move(*h));
        }
        levels.push_back(std::move(level));
    }

    // leaves 只是 tree[0] 的副本，必须逐项一致
    if (!levels.empty() && levels.front().size() != leaves.size()) {
        return malformed("tree level 0 must have as many entries as leaves");
    }
    if (!levels.empty() && levels.front() != leaves) {
        return malformed("tree level 0 must equal leaves");
    }

    auto tree = Tree::from_levels(std::move(levels), options);
    if (tree) {
        VLOG(1) << "deserialized merkle tree: " << tree->leaf_count() << " leaves, depth "
                << tree->depth();
    }
    return tree;
}

std::string serialize_proof(const Proof& proof)
{
    auto doc = nlohmann::json::array();
    for (const auto& step : proof) {
        doc.push_back(nlohmann::json {
            { SIBLING_KEY, Hex::encode(step.sibling) },
            { POSITION_KEY, std::string(MerkleTree::to_string(step.position)) },
        });
    }
    return doc.dump();
}

Result<Proof> deserialize_proof(std::string_view text)
{
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        return invalid_proof("text is not valid JSON");
    }
    if (!doc.is_array()) {
        return invalid_proof("proof must be an array");
    }

    Proof proof;
    proof.reserve(doc.size());
    for (size_t i = 0; i < doc.size(); ++i) {
        const auto& item = doc[i];
        if (!item.is_object()) {
            return invalid_proof("proof item must be an object", i);
        }

        const auto sibling_it = item.find(SIBLING_KEY);
        if (sibling_it == item.end()) {
            return invalid_proof("proof sibling is missing", i);
        }
        auto sibling = decode_hash(*sibling_it);
        if (!sibling) {
            return invalid_proof("proof sibling must be a hex string", i);
        }

        const auto position_it = item.find(POSITION_KEY);
        if (position_it == item.end() || !position_it->is_string()) {
            return invalid_proof("proof position must be a string", i);
        }
        const auto& tag = position_it->get_ref<const std::string&>();
        Position position;
        if (tag == "left") {
            position = Position::Left;
        } else if (tag == "right") {
            position = Position::Right;
        } else {
            return invalid_proof(R"(proof position must be either "left" or "right")", i);
        }

        proof.push_back(ProofStep { .sibling = std::move(*sibling), .position = position });
    }
    return proof;
}

} // namespace Merkla::Codec
