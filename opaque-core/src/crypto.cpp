#include "crypto.hpp"

#include <memory>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

namespace Opaque {
namespace crypto {

namespace {

const unsigned char *bytes(const std::string &s) {
  return reinterpret_cast<const unsigned char *>(s.data());
}

using CipherCtx =
    std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtx newCipherCtx() {
  CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
  if (!ctx)
    throw CryptoError("EVP_CIPHER_CTX_new failed");
  return ctx;
}

void requireAesParams(const std::string &key, const std::string &iv) {
  if (key.size() != 16 || iv.size() != 16)
    throw CryptoError("AES-128-CBC needs a 16 byte key and IV");
}

} // namespace

std::string sha256(const std::string &data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &length, EVP_sha256(),
                 nullptr) != 1) {
    throw CryptoError("SHA-256 digest failed");
  }
  return std::string(reinterpret_cast<char *>(digest), length);
}

std::string hmacSha256(const std::string &key, const std::string &data) {
  unsigned char mac[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
            bytes(data), data.size(), mac, &length)) {
    throw CryptoError("HMAC-SHA256 failed");
  }
  return std::string(reinterpret_cast<char *>(mac), length);
}

std::string pbkdf2Sha256(const std::string &password, const std::string &salt,
                         int iterations, size_t length) {
  std::string out(length, '\0');
  if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                        bytes(salt), static_cast<int>(salt.size()), iterations,
                        EVP_sha256(), static_cast<int>(length),
                        reinterpret_cast<unsigned char *>(&out[0])) != 1) {
    throw CryptoError("PBKDF2 key derivation failed");
  }
  return out;
}

std::string randomBytes(size_t count) {
  std::string out(count, '\0');
  if (count > 0 && RAND_bytes(reinterpret_cast<unsigned char *>(&out[0]),
                              static_cast<int>(count)) != 1) {
    throw CryptoError("RAND_bytes failed");
  }
  return out;
}

std::string aes128CbcEncrypt(const std::string &key, const std::string &iv,
                             const std::string &plaintext) {
  requireAesParams(key, iv);
  CipherCtx ctx = newCipherCtx();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, bytes(key),
                         bytes(iv)) != 1) {
    throw CryptoError("AES encrypt init failed");
  }

  std::vector<unsigned char> out(plaintext.size() + 16);
  int written = 0;
  int finalLen = 0;
  if (EVP_EncryptUpdate(ctx.get(), out.data(), &written, bytes(plaintext),
                        static_cast<int>(plaintext.size())) != 1 ||
      EVP_EncryptFinal_ex(ctx.get(), out.data() + written, &finalLen) != 1) {
    throw CryptoError("AES encrypt failed");
  }
  return std::string(reinterpret_cast<char *>(out.data()),
                     static_cast<size_t>(written + finalLen));
}

std::string aes128CbcDecrypt(const std::string &key, const std::string &iv,
                             const std::string &ciphertext) {
  requireAesParams(key, iv);
  if (ciphertext.empty() || ciphertext.size() % 16 != 0)
    throw CryptoError("ciphertext is not a whole number of blocks");

  CipherCtx ctx = newCipherCtx();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, bytes(key),
                         bytes(iv)) != 1) {
    throw CryptoError("AES decrypt init failed");
  }

  std::vector<unsigned char> out(ciphertext.size() + 16);
  int written = 0;
  int finalLen = 0;
  if (EVP_DecryptUpdate(ctx.get(), out.data(), &written, bytes(ciphertext),
                        static_cast<int>(ciphertext.size())) != 1 ||
      EVP_DecryptFinal_ex(ctx.get(), out.data() + written, &finalLen) != 1) {
    throw CryptoError("AES decrypt failed (bad padding)");
  }
  return std::string(reinterpret_cast<char *>(out.data()),
                     static_cast<size_t>(written + finalLen));
}

bool constantTimeEquals(const std::string &a, const std::string &b) {
  if (a.size() != b.size())
    return false;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

std::string toHex(const std::string &data, bool upper) {
  const char *digits = upper ? "0123456789ABCDEF" : "0123456789abcdef";
  std::string out;
  out.reserve(data.size() * 2);
  for (unsigned char c : data) {
    out += digits[c >> 4];
    out += digits[c & 0x0F];
  }
  return out;
}

std::string base64UrlEncode(const std::string &data) {
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int length = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                               bytes(data), static_cast<int>(data.size()));
  out.resize(static_cast<size_t>(length));
  for (char &c : out) {
    if (c == '+')
      c = '-';
    else if (c == '/')
      c = '_';
  }
  return out;
}

std::string base64UrlDecode(const std::string &text) {
  std::string standard = text;
  for (char &c : standard) {
    if (c == '-')
      c = '+';
    else if (c == '_')
      c = '/';
  }
  while (standard.size() % 4 != 0)
    standard += '=';
  if (standard.empty())
    return "";

  size_t padding = 0;
  if (standard[standard.size() - 1] == '=')
    ++padding;
  if (standard[standard.size() - 2] == '=')
    ++padding;

  std::string out(standard.size() / 4 * 3, '\0');
  int length = EVP_DecodeBlock(reinterpret_cast<unsigned char *>(&out[0]),
                               bytes(standard),
                               static_cast<int>(standard.size()));
  if (length < 0 || static_cast<size_t>(length) < padding)
    throw CryptoError("invalid base64 input");

  // EVP_DecodeBlock counts padding as zero bytes
  out.resize(static_cast<size_t>(length) - padding);
  return out;
}

} // namespace crypto
} // namespace Opaque
