#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace digest
{

constexpr std::size_t DIGEST_SIZE = 32;  // crypto_hash_sha256_BYTES

using Digest = std::array<std::uint8_t, DIGEST_SIZE>;

// SHA-256 over the whole buffer.
Digest compute(const std::uint8_t *data, std::size_t len);
Digest compute(const std::vector<std::uint8_t> &bytes);

// Exact match over all DIGEST_SIZE bytes. A wrong-length expectation is a mismatch.
bool verify(const std::vector<std::uint8_t> &bytes,
            const std::uint8_t              *expected,
            std::size_t                      expected_len);
bool verify(const std::vector<std::uint8_t> &bytes, const Digest &expected);

std::string to_hex(const Digest &d);
bool        from_hex(std::string_view hex, Digest &out);

}  // namespace digest
