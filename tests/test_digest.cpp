// tests/test_digest.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#include "crypto/digest.hpp"

static std::vector<std::uint8_t> bytes_of(const std::string &s)
{
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

TEST(Digest, KnownVectors)
{
    EXPECT_EQ(digest::to_hex(digest::compute(std::vector<std::uint8_t>{})),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(digest::to_hex(digest::compute(bytes_of("abc"))),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(Digest, Deterministic)
{
    auto data = bytes_of("the same bytes twice");
    EXPECT_EQ(digest::compute(data), digest::compute(data));
}

TEST(Digest, VerifyMatchAndMismatch)
{
    auto       data = bytes_of("payload");
    const auto d    = digest::compute(data);
    EXPECT_TRUE(digest::verify(data, d));

    data[0] ^= 0x01;
    EXPECT_FALSE(digest::verify(data, d));
}

TEST(Digest, VerifyRejectsWrongLength)
{
    auto       data = bytes_of("payload");
    const auto d    = digest::compute(data);
    // a truncated expectation is never accepted, even when the prefix matches
    EXPECT_FALSE(digest::verify(data, d.data(), d.size() - 1));
    EXPECT_FALSE(digest::verify(data, nullptr, 0));

    std::vector<std::uint8_t> longer(d.begin(), d.end());
    longer.push_back(0);
    EXPECT_FALSE(digest::verify(data, longer.data(), longer.size()));
}

TEST(Digest, HexRoundtrip)
{
    const auto     d = digest::compute(bytes_of("hex me"));
    digest::Digest back{};
    ASSERT_TRUE(digest::from_hex(digest::to_hex(d), back));
    EXPECT_EQ(back, d);

    EXPECT_FALSE(digest::from_hex("abcd", back));
    EXPECT_FALSE(digest::from_hex(std::string(64, 'z'), back));
}
