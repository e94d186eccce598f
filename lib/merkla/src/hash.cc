#include "merkla/hash.hpp"
#include "merkla/error.hpp"

#include <glog/logging.h>
#include <memory>
#include <openssl/evp.h>

namespace Merkla::Hashing {

namespace {

    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX,
        decltype([](EVP_MD_CTX* ctx) {
            EVP_MD_CTX_free(ctx);
        })>;

    constexpr std::array<HashAlgorithm, 10> ALL_ALGORITHMS {
        HashAlgorithm::Md5,
        HashAlgorithm::Sha1,
        HashAlgorithm::Sha224,
        HashAlgorithm::Sha256,
        HashAlgorithm::Sha384,
        HashAlgorithm::Sha512,
        HashAlgorithm::Sha3_256,
        HashAlgorithm::Sha3_512,
        HashAlgorithm::Ripemd160,
        HashAlgorithm::Identity
    };

    const EVP_MD* evp_md(HashAlgorithm algorithm)
    {
        switch (algorithm) {
        case HashAlgorithm::Md5:
            return EVP_md5();
        case HashAlgorithm::Sha1:
            return EVP_sha1();
        case HashAlgorithm::Sha224:
            return EVP_sha224();
        case HashAlgorithm::Sha256:
            return EVP_sha256();
        case HashAlgorithm::Sha384:
            return EVP_sha384();
        case HashAlgorithm::Sha512:
            return EVP_sha512();
        case HashAlgorithm::Sha3_256:
            return EVP_sha3_256();
        case HashAlgorithm::Sha3_512:
            return EVP_sha3_512();
        case HashAlgorithm::Ripemd160:
            return EVP_ripemd160();
        case HashAlgorithm::Identity:
            break;
        }
        return nullptr;
    }

    auto evp_digest(const EVP_MD* md, BytesSpan data)
        -> std::expected<Bytes, std::error_code>
    {
        const auto failure = make_error_code(Errc::HashFailure);
        if (md == nullptr) {
            return std::unexpected(failure);
        }

        EvpMdCtxPtr ctx(EVP_MD_CTX_new());
        if (!ctx) {
            return std::unexpected(failure);
        }

        // ripemd160 在部分 OpenSSL 3 构建里只存在于 legacy provider，Init 会失败
        if (1 != EVP_DigestInit_ex(ctx.get(), md, nullptr)) {
            VLOG(1) << "EVP_DigestInit_ex failed for " << EVP_MD_get0_name(md);
            return std::unexpected(failure);
        }

        if (1 != EVP_DigestUpdate(ctx.get(), u8ptr(data), data.size())) {
            return std::unexpected(failure);
        }

        Bytes out(static_cast<size_t>(EVP_MD_get_size(md)));
        unsigned int len = 0;
        if (1 != EVP_DigestFinal_ex(ctx.get(), u8ptr(out.data()), &len)) {
            return std::unexpected(failure);
        }
        out.resize(len);
        return out;
    }

} // namespace

auto digest(HashAlgorithm algorithm, BytesSpan data)
    -> std::expected<Bytes, std::error_code>
{
    if (algorithm == HashAlgorithm::Identity) {
        return Bytes(data.begin(), data.end());
    }
    return evp_digest(evp_md(algorithm), data);
}

auto sha256(BytesSpan data) -> std::expected<Bytes, std::error_code>
{
    return evp_digest(EVP_sha256(), data);
}

HashFunction make_hash_function(HashAlgorithm algorithm)
{
    return [algorithm](BytesSpan data) {
        return digest(algorithm, data);
    };
}

std::size_t digest_size(HashAlgorithm algorithm) noexcept
{
    switch (algorithm) {
    case HashAlgorithm::Md5:
        return 16;
    case HashAlgorithm::Sha1:
    case HashAlgorithm::Ripemd160:
        return 20;
    case HashAlgorithm::Sha224:
        return 28;
    case HashAlgorithm::Sha256:
    case HashAlgorithm::Sha3_256:
        return 32;
    case HashAlgorithm::Sha384:
        return 48;
    case HashAlgorithm::Sha512:
    case HashAlgorithm::Sha3_512:
        return 64;
    case HashAlgorithm::Identity:
        break;
    }
    return 0;
}

std::string_view to_string(HashAlgorithm algorithm) noexcept
{
    switch (algorithm) {
    case HashAlgorithm::Md5:
        return "md5";
    case HashAlgorithm::Sha1:
        return "sha1";
    case HashAlgorithm::Sha224:
        return "sha224";
    case HashAlgorithm::Sha256:
        return "sha256";
    case HashAlgorithm::Sha384:
        return "sha384";
    case HashAlgorithm::Sha512:
        return "sha512";
    case HashAlgorithm::Sha3_256:
        return "sha3-256";
    case HashAlgorithm::Sha3_512:
        return "sha3-512";
    case HashAlgorithm::Ripemd160:
        return "ripemd160";
    case HashAlgorithm::Identity:
        return "none";
    }
    return "unknown";
}

std::optional<HashAlgorithm> parse_hash_algorithm(std::string_view name)
{
    for (auto algorithm : ALL_ALGORITHMS) {
        if (to_string(algorithm) == name) {
            return algorithm;
        }
    }
    return std::nullopt;
}

std::span<const HashAlgorithm> supported_algorithms() noexcept
{
    return ALL_ALGORITHMS;
}

} // namespace Merkla::Hashing
