#pragma once
#include "merkla/common.hpp"
#include "merkla/hash.hpp"
#include "merkla/hex.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace Merkla {

// 辅助：把一组字符串转成叶子
inline std::vector<Bytes> to_leaves(const std::vector<std::string>& items)
{
    std::vector<Bytes> res;
    res.reserve(items.size());
    for (const auto& s : items)
        res.push_back(to_bytes(s));
    return res;
}

// 辅助：测试里的哈希一定成功
inline Bytes sha256_of(BytesSpan data)
{
    auto h = Hashing::sha256(data);
    EXPECT_TRUE(h.has_value());
    return h.value_or(Bytes {});
}

inline Bytes sha256_of(std::string_view s)
{
    return sha256_of(as_span(s));
}

inline Bytes concat(BytesSpan a, BytesSpan b)
{
    Bytes out(a.begin(), a.end());
    out.insert(out.end(), b.begin(), b.end());
    return out;
}

inline Bytes from_hex(std::string_view hex)
{
    auto b = Hex::decode(hex);
    EXPECT_TRUE(b.has_value()) << "bad hex literal " << hex;
    return b.value_or(Bytes {});
}

} // namespace Merkla
