#include "vault.hpp"
#include "crypto.hpp"

#include <chrono>
#include <cstdlib>

namespace Opaque {

namespace {

const char *const kStaticSalt = "opaque_static_salt";
const int kIterations = 100000;

const char *const kTokenPrefix = "[VAULT:";
const unsigned char kFernetVersion = 0x80;

// version(1) + timestamp(8) + iv(16) + hmac(32)
const size_t kOverhead = 1 + 8 + 16 + 32;

uint64_t nowSeconds() {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

} // namespace

Vault::Vault(const std::string &masterKey) {
  std::string key = masterKey;
  if (key.empty()) {
    const char *env = std::getenv("OPAQUE_MASTER_KEY");
    if (env)
      key = env;
  }
  if (key.empty())
    return;

  std::string derived = crypto::pbkdf2Sha256(key, kStaticSalt, kIterations, 32);
  signingKey_ = derived.substr(0, 16);
  encryptionKey_ = derived.substr(16, 16);
  configured_ = true;
}

std::string Vault::encrypt(const std::string &data) {
  if (!configured_)
    return "[VAULT-NO-KEY-CONFIGURED]";

  std::string token = makeToken(data, nowSeconds(), crypto::randomBytes(16));
  return kTokenPrefix + crypto::base64UrlEncode(token) + "]";
}

std::string Vault::decrypt(const std::string &token) {
  if (!configured_)
    throw VaultError("No master key configured");

  std::string payload = token;
  if (isWrappedToken(payload)) {
    payload = payload.substr(7, payload.size() - 8);
  }

  std::string raw;
  try {
    raw = crypto::base64UrlDecode(payload);
  } catch (const crypto::CryptoError &e) {
    throw VaultError(std::string("malformed token: ") + e.what());
  }

  if (raw.size() < kOverhead + 16 ||
      static_cast<unsigned char>(raw[0]) != kFernetVersion) {
    throw VaultError("malformed token");
  }

  std::string signedPart = raw.substr(0, raw.size() - 32);
  std::string mac = raw.substr(raw.size() - 32);
  if (!crypto::constantTimeEquals(crypto::hmacSha256(signingKey_, signedPart),
                                  mac)) {
    throw VaultError("invalid token signature (wrong key?)");
  }

  std::string iv = raw.substr(9, 16);
  std::string ciphertext = raw.substr(25, raw.size() - kOverhead);
  try {
    return crypto::aes128CbcDecrypt(encryptionKey_, iv, ciphertext);
  } catch (const crypto::CryptoError &e) {
    throw VaultError(e.what());
  }
}

bool Vault::isWrappedToken(const std::string &text) {
  return text.size() > 8 && text.compare(0, 7, kTokenPrefix) == 0 &&
         text.back() == ']';
}

std::string Vault::makeToken(const std::string &data, uint64_t timestamp,
                             const std::string &iv) const {
  std::string token;
  token += static_cast<char>(kFernetVersion);
  for (int shift = 56; shift >= 0; shift -= 8) {
    token += static_cast<char>((timestamp >> shift) & 0xFF);
  }
  token += iv;
  token += crypto::aes128CbcEncrypt(encryptionKey_, iv, data);
  token += crypto::hmacSha256(signingKey_, token);
  return token;
}

} // namespace Opaque
