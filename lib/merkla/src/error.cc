#include "merkla/error.hpp"

#include <utility>

namespace Merkla {

std::string Error::message() const
{
    std::string out = code.message();
    if (index) {
        out += " (index " + std::to_string(*index) + ")";
    }
    if (!detail.empty()) {
        out += ": ";
        out += detail;
    }
    return out;
}

Error make_error(Errc e, std::string detail)
{
    return Error { .code = make_error_code(e), .index = std::nullopt, .detail = std::move(detail) };
}

Error make_error(Errc e, std::size_t index, std::string detail)
{
    return Error { .code = make_error_code(e), .index = index, .detail = std::move(detail) };
}

} // namespace Merkla
