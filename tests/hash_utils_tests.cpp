/**
 * @file hash_utils_tests.cpp
 * @brief Digest helpers against published test vectors
 *
 * @date 2025
 */

#include "stratus/utils/hash_utils.hpp"

#include <gtest/gtest.h>

using stratus::utils::HashUtils;

TEST(HashUtilsTest, Sha256OfEmptyString) {
    EXPECT_EQ(HashUtils::Sha256Hex(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, Sha256OfAbc) {
    EXPECT_EQ(HashUtils::Sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, HmacSha256Rfc4231Case2) {
    std::string mac = HashUtils::HmacSha256("Jefe", "what do ya want for nothing?");
    EXPECT_EQ(mac.size(), 32u);
    EXPECT_EQ(HashUtils::ToHex(mac),
              "5bdcc146bf60754e6a042426089575c75a003f089d2739839dec58b964ec3843");
}

TEST(HashUtilsTest, ToHexPadsBytes) {
    EXPECT_EQ(HashUtils::ToHex(std::string("\x00\x0f\xff", 3)), "000fff");
}
