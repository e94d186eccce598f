#include "merkla/hex.hpp"

namespace Merkla::Hex {

namespace {

    constexpr char HEX_LOWER[] = "0123456789abcdef";

    int from_hex(char c)
    {
        if (c >= '0' && c <= '9')
            return c - '0';
        if (c >= 'a' && c <= 'f')
            return 10 + (c - 'a');
        if (c >= 'A' && c <= 'F')
            return 10 + (c - 'A');
        return -1;
    }

} // namespace

std::string encode(BytesSpan data)
{
    std::string out;
    out.resize(data.size() * 2);
    for (size_t i = 0; i < data.size(); ++i) {
        const auto b = data[i];
        out[i * 2] = HEX_LOWER[(b >> 4) & 0x0F];
        out[i * 2 + 1] = HEX_LOWER[b & 0x0F];
    }
    return out;
}

bool is_hex(std::string_view s)
{
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (from_hex(c) < 0) {
            return false;
        }
    }
    return true;
}

std::optional<Bytes> decode(std::string_view hex)
{
    if (!is_hex(hex) || hex.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = from_hex(hex[i]);
        int lo = from_hex(hex[i + 1]);
        out.push_back(static_cast<Byte>((hi << 4) | lo));
    }
    return out;
}

} // namespace Merkla::Hex
