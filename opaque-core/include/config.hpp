#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace Opaque {

using json = nlohmann::json;

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &message)
      : std::runtime_error(message) {}
};

enum class ObfuscationMethod { Hash, Mask, Vault, Anonymize };

// Case-insensitive ("HASH", "mask", ...). Throws ConfigError.
ObfuscationMethod parseObfuscationMethod(const std::string &name);

std::string toString(ObfuscationMethod method);

struct ScannerConfig {
  std::vector<std::string> rules; // validator ids, applied in this order
  ObfuscationMethod method = ObfuscationMethod::Hash;
  std::string vaultKey;  // VAULT method; empty -> $OPAQUE_MASTER_KEY
  std::string salt;      // HASH method; empty -> $OPAQUE_SALT
  std::string secretKey; // ANONYMIZE uses keyed pseudonyms when set
  std::vector<std::string> honeytokens;
  std::string honeytokenWebhook; // alerts are POSTed here when set

  // Circuit breaker
  int circuitThreshold = 1000;
  int floodMatchesPerRule = 10;
  int circuitResetMs = 5000;
};

struct AuditConfig {
  std::string output = "opaque_report.html";
};

struct LogConfig {
  std::string level = "INFO";
};

struct OpaqueConfig {
  ScannerConfig scanner;
  AuditConfig audit;
  LogConfig log;
};

// Overlays the keys present in `root` onto `config`. Ill-typed values are
// skipped; unknown rule ids and method names throw ConfigError.
void applyConfig(const json &root, OpaqueConfig &config);

OpaqueConfig parseConfig(const json &root);

OpaqueConfig loadConfigFile(const std::string &path);

// Fills empty secrets from OPAQUE_SALT, OPAQUE_MASTER_KEY, OPAQUE_SECRET_KEY
void applyEnvironment(OpaqueConfig &config);

} // namespace Opaque
