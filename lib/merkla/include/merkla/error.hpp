#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <system_error>

namespace Merkla {

enum class Errc : std::uint8_t {
    Success = 0,
    EmptyInput, // 构建时叶子为空
    IndexOutOfRange, // 叶子索引越界
    InvalidProof, // Proof 结构不合法
    HashFailure, // 哈希函数失败
    MalformedSerialization // 反序列化数据不合法
};

class MerklaErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "merkla"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Errc>(ev)) {
        case Errc::Success:
            return "Success";
        case Errc::EmptyInput:
            return "Cannot create tree from empty data";
        case Errc::IndexOutOfRange:
            return "Leaf index out of range";
        case Errc::InvalidProof:
            return "Invalid proof";
        case Errc::HashFailure:
            return "Hash function failed";
        case Errc::MalformedSerialization:
            return "Malformed serialized tree";
        default:
            return "Unknown merkla error";
        }
    }
};

inline const std::error_category& merkla_category()
{
    static MerklaErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Errc e)
{
    return { static_cast<int>(e), merkla_category() };
}

/// Error value returned by every fallible operation.
/// `index` is the leaf (or proof step) the failure refers to, when known.
struct Error {
    std::error_code code;
    std::optional<std::size_t> index;
    std::string detail;

    [[nodiscard]] std::string message() const;

    bool operator==(Errc e) const { return code == make_error_code(e); }
};

[[nodiscard]] Error make_error(Errc e, std::string detail = {});
[[nodiscard]] Error make_error(Errc e, std::size_t index, std::string detail = {});

template <typename T>
using Result = std::expected<T, Error>;

} // namespace Merkla

namespace std {
template <>
struct is_error_code_enum<Merkla::Errc> : true_type { };
} // namespace std
