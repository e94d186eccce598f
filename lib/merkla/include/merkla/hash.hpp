#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <string_view>
#include <system_error>

#include "merkla/common.hpp"

namespace Merkla::Hashing {

enum class HashAlgorithm : std::uint8_t {
    Md5,
    Sha1,
    Sha224,
    Sha256,
    Sha384,
    Sha512,
    Sha3_256,
    Sha3_512,
    Ripemd160,
    Identity // "none": 原样返回输入
};

// 任意 bytes -> bytes 的确定性函数，不限制输出长度
using HashFunction = std::function<std::expected<Bytes, std::error_code>(BytesSpan)>;

[[nodiscard]] HashFunction make_hash_function(HashAlgorithm algorithm);

// Output length in bytes; 0 for Identity, whose output length follows its input.
[[nodiscard]] std::size_t digest_size(HashAlgorithm algorithm) noexcept;

[[nodiscard]] std::string_view to_string(HashAlgorithm algorithm) noexcept;
[[nodiscard]] std::optional<HashAlgorithm> parse_hash_algorithm(std::string_view name);

[[nodiscard]] std::span<const HashAlgorithm> supported_algorithms() noexcept;

[[nodiscard]] auto digest(HashAlgorithm algorithm, BytesSpan data)
    -> std::expected<Bytes, std::error_code>;

// 默认哈希
[[nodiscard]] auto sha256(BytesSpan data) -> std::expected<Bytes, std::error_code>;

} // namespace Merkla::Hashing
