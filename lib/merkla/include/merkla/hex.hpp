#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "merkla/common.hpp"

namespace Merkla::Hex {

// Lowercase, two characters per byte.
[[nodiscard]] std::string encode(BytesSpan data);

// Accepts upper and lower case. Empty, odd-length or non-hex input yields nullopt.
[[nodiscard]] std::optional<Bytes> decode(std::string_view hex);

[[nodiscard]] bool is_hex(std::string_view s);

} // namespace Merkla::Hex
