#include "algorithms.hpp"

#include <gtest/gtest.h>

using namespace Opaque::algorithms;

TEST(VerhoeffTests, GeneratesKnownCheckDigits) {
  EXPECT_EQ(Verhoeff::generate("236"), "3");
  EXPECT_EQ(Verhoeff::generate("23"), "6");
  EXPECT_EQ(Verhoeff::generate("1234567890"), "2");
}

TEST(VerhoeffTests, ValidatesNumbersWithCheckDigit) {
  EXPECT_TRUE(Verhoeff::validate("2363"));
  EXPECT_TRUE(Verhoeff::validate("236"));
  EXPECT_TRUE(Verhoeff::validate("12345678902"));
  EXPECT_FALSE(Verhoeff::validate("12345678901"));
}

TEST(VerhoeffTests, CatchesAdjacentTransposition) {
  ASSERT_TRUE(Verhoeff::validate("12345678902"));
  EXPECT_FALSE(Verhoeff::validate("21345678902"));
  EXPECT_FALSE(Verhoeff::validate("12354678902"));
}

TEST(VerhoeffTests, RejectsNonDigits) {
  EXPECT_FALSE(Verhoeff::validate(""));
  EXPECT_FALSE(Verhoeff::validate("12a4"));
}

TEST(LuhnTests, KnownNumbers) {
  EXPECT_TRUE(Luhn::validate("79927398713"));
  EXPECT_TRUE(Luhn::validate("4111111111111111"));
  EXPECT_TRUE(Luhn::validate("5555555555554444"));
  EXPECT_FALSE(Luhn::validate("79927398710"));
  EXPECT_FALSE(Luhn::validate("4111111111111112"));
}

TEST(LuhnTests, RejectsNonDigits) {
  EXPECT_FALSE(Luhn::validate(""));
  EXPECT_FALSE(Luhn::validate("4111-1111"));
}

TEST(ISO7064Tests, Mod97_10) {
  // GB82 WEST 1234 5698 7654 32 rearranged and converted to digits
  EXPECT_TRUE(ISO7064::mod97_10("3214282912345698765432161182"));
  EXPECT_FALSE(ISO7064::mod97_10("3214282912345698765432161183"));
  EXPECT_FALSE(ISO7064::mod97_10(""));
}

TEST(ISO7064Tests, Mod11_2) {
  EXPECT_TRUE(ISO7064::mod11_2("0000-0002-1825-0097"));
  EXPECT_TRUE(ISO7064::mod11_2("0000000218250097"));
  EXPECT_FALSE(ISO7064::mod11_2("0000-0002-1825-0098"));
}

TEST(Mod11Tests, CalculatesWeightedDigit) {
  // First CPF check digit of 529.982.247-25
  std::vector<int> digits = {5, 2, 9, 9, 8, 2, 2, 4, 7};
  std::vector<int> weights = {10, 9, 8, 7, 6, 5, 4, 3, 2};
  EXPECT_EQ(Mod11::calculateCheckDigit(digits, weights), 2);
}
