#include "fingerprint.hpp"
#include "crypto.hpp"

#include <cstdlib>

namespace Opaque {

namespace {
const char *const kDefaultSalt = "default_insecure_salt_change_me";
}

Fingerprinter::Fingerprinter(const std::string &salt) : salt_(salt) {
  if (salt_.empty()) {
    const char *env = std::getenv("OPAQUE_SALT");
    salt_ = (env && *env) ? env : kDefaultSalt;
  }
}

std::string Fingerprinter::hash(const std::string &data) const {
  std::string digest = crypto::toHex(crypto::sha256(data + salt_), true);
  return "[HASH-" + digest.substr(0, 4) + "]";
}

} // namespace Opaque
