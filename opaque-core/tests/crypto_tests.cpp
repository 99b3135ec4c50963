#include "crypto.hpp"
#include "fingerprint.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace Opaque;

TEST(CryptoTests, Sha256KnownVector) {
  EXPECT_EQ(crypto::toHex(crypto::sha256("abc")),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTests, HmacKnownVector) {
  EXPECT_EQ(crypto::toHex(crypto::hmacSha256(
                "key", "The quick brown fox jumps over the lazy dog")),
            "f7bc83f430538424b13298e6aa6fb143ef4d59a14946175997479dbc2d1a3cd8");
}

TEST(CryptoTests, Pbkdf2KnownVector) {
  EXPECT_EQ(crypto::toHex(crypto::pbkdf2Sha256("password", "salt", 1, 32)),
            "120fb6cffcf8b32c43e7225256c4f837a86548c92ccc35480805987cb70be17b");
}

TEST(CryptoTests, AesRoundTripAndPadding) {
  std::string key(16, 'k');
  std::string iv(16, 'i');
  std::string cipher = crypto::aes128CbcEncrypt(key, iv, "sixteen byte msg");
  // PKCS#7 adds a whole block to block-aligned input
  EXPECT_EQ(cipher.size(), 32u);
  EXPECT_EQ(crypto::aes128CbcDecrypt(key, iv, cipher), "sixteen byte msg");

  EXPECT_THROW(crypto::aes128CbcEncrypt("short", iv, "x"), crypto::CryptoError);
  EXPECT_THROW(crypto::aes128CbcDecrypt(key, iv, "not a block"),
               crypto::CryptoError);
}

TEST(CryptoTests, Base64UrlUsesUrlAlphabet) {
  std::string bytes("\xfb\xff\xfe", 3);
  EXPECT_EQ(crypto::base64UrlEncode(bytes), "-__-");
  EXPECT_EQ(crypto::base64UrlDecode("-__-"), bytes);
  EXPECT_EQ(crypto::base64UrlEncode("ab"), "YWI=");
  EXPECT_EQ(crypto::base64UrlDecode("YWI="), "ab");
  EXPECT_EQ(crypto::base64UrlDecode("YWI"), "ab");
  EXPECT_THROW(crypto::base64UrlDecode("@@@@"), crypto::CryptoError);
}

TEST(CryptoTests, ConstantTimeEquals) {
  EXPECT_TRUE(crypto::constantTimeEquals("abc", "abc"));
  EXPECT_FALSE(crypto::constantTimeEquals("abc", "abd"));
  EXPECT_FALSE(crypto::constantTimeEquals("abc", "abcd"));
}

TEST(CryptoTests, RandomBytesLength) {
  EXPECT_EQ(crypto::randomBytes(16).size(), 16u);
  EXPECT_NE(crypto::randomBytes(16), crypto::randomBytes(16));
}

TEST(FingerprintTests, DeterministicTag) {
  Fingerprinter fingerprint("test_salt");
  EXPECT_EQ(fingerprint.hash("529.982.247-25"), "[HASH-091A]");
  EXPECT_EQ(fingerprint("529.982.247-25"), "[HASH-091A]");
  EXPECT_EQ(fingerprint.hash("4111111111111111"), "[HASH-74C6]");
}

TEST(FingerprintTests, SaltChangesTag) {
  Fingerprinter a("salt-a");
  Fingerprinter b("salt-b");
  EXPECT_EQ(a.hash("value"), a.hash("value"));
  EXPECT_NE(a.hash("value"), b.hash("value"));
}

TEST(FingerprintTests, SaltFallsBackToEnvironmentThenDefault) {
  unsetenv("OPAQUE_SALT");
  Fingerprinter fallback;
  EXPECT_EQ(fallback.salt(), "default_insecure_salt_change_me");
  EXPECT_EQ(fallback.hash("hello"), "[HASH-ACAA]");

  setenv("OPAQUE_SALT", "from-env", 1);
  Fingerprinter fromEnv;
  EXPECT_EQ(fromEnv.salt(), "from-env");
  unsetenv("OPAQUE_SALT");
}
