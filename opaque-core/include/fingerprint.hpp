#pragma once

#include <string>

namespace Opaque {

// Deterministic short hash for log correlation: the same value and salt
// always give the same tag.
class Fingerprinter {
public:
  // Empty salt falls back to $OPAQUE_SALT, then to a fixed default
  explicit Fingerprinter(const std::string &salt = "");

  // "[HASH-XXXX]" from the first 4 hex digits of SHA-256(data + salt)
  std::string hash(const std::string &data) const;

  std::string operator()(const std::string &data) const { return hash(data); }

  const std::string &salt() const { return salt_; }

private:
  std::string salt_;
};

} // namespace Opaque
