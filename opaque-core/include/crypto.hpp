#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace Opaque {
namespace crypto {

class CryptoError : public std::runtime_error {
public:
  explicit CryptoError(const std::string &message)
      : std::runtime_error(message) {}
};

// Byte strings in, byte strings out. Everything below throws CryptoError
// when libcrypto reports a failure.
std::string sha256(const std::string &data);

std::string hmacSha256(const std::string &key, const std::string &data);

std::string pbkdf2Sha256(const std::string &password, const std::string &salt,
                         int iterations, size_t length);

std::string randomBytes(size_t count);

std::string aes128CbcEncrypt(const std::string &key, const std::string &iv,
                             const std::string &plaintext);

std::string aes128CbcDecrypt(const std::string &key, const std::string &iv,
                             const std::string &ciphertext);

bool constantTimeEquals(const std::string &a, const std::string &b);

std::string toHex(const std::string &bytes, bool upper = false);

// RFC 4648 url-safe alphabet, padded
std::string base64UrlEncode(const std::string &bytes);

std::string base64UrlDecode(const std::string &text);

} // namespace crypto
} // namespace Opaque
