#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Merkla {
using Byte = uint8_t;
using Bytes = std::vector<Byte>;
using BytesSpan = std::span<const Byte>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

inline Bytes to_bytes(std::string_view s)
{
    return Bytes(s.begin(), s.end());
}

// OpenSSL 接口统一使用 unsigned char*
inline const unsigned char* u8ptr(BytesSpan s)
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

inline unsigned char* u8ptr(Byte* p)
{
    return reinterpret_cast<unsigned char*>(p);
}

} // namespace Merkla
