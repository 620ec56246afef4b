//! # Fingerprint Tests
//!
//! CRC32C check values and 128-bit content fingerprints.

#include "cache/fingerprint.hpp"
#include "common/crc32c.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace smc;
using namespace smc::cache;

TEST(Crc32cTest, CheckValue) {
    EXPECT_EQ(crc32c("123456789"), 0xE3069283u);
    EXPECT_EQ(crc32c(""), 0u);
}

TEST(Crc32cTest, IscsiVectors) {
    const std::string zeros(32, '\x00');
    const std::string ones(32, '\xFF');
    EXPECT_EQ(crc32c(zeros), 0x8A9136AAu);
    EXPECT_EQ(crc32c(ones), 0x62A8AB43u);
}

TEST(Crc32cTest, Hex8IsZeroPadded) {
    EXPECT_EQ(crc32c_hex8(0xE3069283u), "e3069283");
    EXPECT_EQ(crc32c_hex8(0x1Fu), "0000001f");
}

TEST(FingerprintTest, EmptyInputIsZero) {
    EXPECT_TRUE(fingerprint_string("").is_zero());
    EXPECT_FALSE(fingerprint_string("x").is_zero());
}

TEST(FingerprintTest, Deterministic) {
    EXPECT_EQ(fingerprint_string("fn main() {}"), fingerprint_string("fn main() {}"));
    EXPECT_NE(fingerprint_string("fn main() {}"), fingerprint_string("fn main() { }"));
}

TEST(FingerprintTest, HexHas32Digits) {
    auto hex = fingerprint_string("struct Camera {}").to_hex();
    EXPECT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST(FingerprintTest, CombineIsOrderSensitive) {
    auto a = fingerprint_string("a");
    auto b = fingerprint_string("b");
    EXPECT_NE(fingerprint_combine(a, b), fingerprint_combine(b, a));
    EXPECT_EQ(fingerprint_combine(a, b), fingerprint_combine(a, b));
}
