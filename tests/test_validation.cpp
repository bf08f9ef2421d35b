#include <gtest/gtest.h>
#include <deviceid/deviceid.hpp>

#include <string>

namespace deviceid {
namespace {

TEST(IsValidSha256Test, AllZerosIsValid) {
    EXPECT_TRUE(is_valid_sha256(std::string(64, '0')));
}

TEST(IsValidSha256Test, RealDigestIsValid) {
    EXPECT_TRUE(is_valid_sha256("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"));
}

TEST(IsValidSha256Test, WrongLengthIsInvalid) {
    for (size_t len : {0u, 1u, 32u, 63u, 65u, 128u}) {
        EXPECT_FALSE(is_valid_sha256(std::string(len, 'a'))) << "length " << len;
    }
}

TEST(IsValidSha256Test, AnyCharacterOutsideLowercaseHexIsInvalid) {
    for (int c = 0; c < 256; ++c) {
        char ch = static_cast<char>(c);
        bool hex = (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f');

        std::string s(64, '0');
        s[17] = ch;

        EXPECT_EQ(is_valid_sha256(s), hex) << "character code " << c;
    }
}

TEST(IsValidSha256Test, UppercaseHexIsInvalid) {
    EXPECT_FALSE(is_valid_sha256(std::string(64, 'A')));
}

TEST(IsValidSha256Test, TrailingNewlineIsInvalid) {
    EXPECT_FALSE(is_valid_sha256(std::string(63, 'a') + "\n"));
    EXPECT_FALSE(is_valid_sha256(std::string(64, 'a') + "\n"));
}

TEST(IsValidSha256Test, NotAHashIsInvalid) {
    EXPECT_FALSE(is_valid_sha256("not-a-hash"));
}

}  // namespace
}  // namespace deviceid
