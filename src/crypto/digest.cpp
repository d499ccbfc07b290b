#include <cstring>
#include <sodium.h>

#include "crypto/digest.hpp"
#include "util/log.hpp"

namespace digest
{

static_assert(DIGEST_SIZE == crypto_hash_sha256_BYTES, "digest size mismatch");

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

Digest compute(const std::uint8_t *data, std::size_t len)
{
    if (!ensure_sodium_init())
        LOG_WARN("sodium_init failed, hashing without library init");

    Digest out{};
    // sodium wants a valid pointer even for zero-length input
    static const std::uint8_t empty = 0;
    crypto_hash_sha256(out.data(), data ? data : &empty, static_cast<unsigned long long>(len));
    return out;
}

Digest compute(const std::vector<std::uint8_t> &bytes)
{
    return compute(bytes.data(), bytes.size());
}

bool verify(const std::vector<std::uint8_t> &bytes,
            const std::uint8_t              *expected,
            std::size_t                      expected_len)
{
    if (!expected || expected_len != DIGEST_SIZE)
    {
        LOG_DEBUG("verify: expected digest has wrong length (%zu)", expected_len);
        return false;
    }
    const Digest got = compute(bytes);
    return std::memcmp(got.data(), expected, DIGEST_SIZE) == 0;
}

bool verify(const std::vector<std::uint8_t> &bytes, const Digest &expected)
{
    return verify(bytes, expected.data(), expected.size());
}

std::string to_hex(const Digest &d)
{
    char hex[DIGEST_SIZE * 2 + 1];
    sodium_bin2hex(hex, sizeof hex, d.data(), d.size());
    return std::string(hex);
}

bool from_hex(std::string_view hex, Digest &out)
{
    ensure_sodium_init();
    std::size_t out_len = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(), nullptr, &out_len,
                       nullptr) != 0 ||
        out_len != out.size())
    {
        return false;
    }
    return true;
}

}  // namespace digest
