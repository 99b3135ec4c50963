#pragma once

#include "callbacks.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Opaque {

class VaultError : public std::runtime_error {
public:
  explicit VaultError(const std::string &message)
      : std::runtime_error(message) {}
};

// Reversible encryption of detected values. Tokens are Fernet tokens
// (AES-128-CBC + HMAC-SHA256) under a key derived from the master key with
// PBKDF2, wrapped as "[VAULT:<token>]" in the sanitized text.
class Vault : public VaultInterface {
public:
  // Empty key falls back to $OPAQUE_MASTER_KEY; without either the vault
  // stays unconfigured
  explicit Vault(const std::string &masterKey = "");

  bool isConfigured() const { return configured_; }

  // "[VAULT-NO-KEY-CONFIGURED]" when unconfigured
  std::string encrypt(const std::string &data) override;

  // Accepts the token with or without its "[VAULT:...]" wrapper. Throws
  // VaultError when unconfigured, malformed or signed with another key.
  std::string decrypt(const std::string &token) override;

  static bool isWrappedToken(const std::string &text);

private:
  std::string makeToken(const std::string &data, uint64_t timestamp,
                        const std::string &iv) const;

  std::string signingKey_;
  std::string encryptionKey_;
  bool configured_{false};
};

} // namespace Opaque
