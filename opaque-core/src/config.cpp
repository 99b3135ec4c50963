#include "config.hpp"
#include "text_processor.hpp"
#include "validators.hpp"

#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace Opaque {

namespace {

std::vector<std::string> stringList(const json &value) {
  std::vector<std::string> out;
  for (const auto &item : value) {
    if (item.is_string())
      out.push_back(item.get<std::string>());
  }
  return out;
}

// Non-negative integers that fit an int; anything else keeps the default
void readCount(const json &section, const char *name, int &field) {
  if (!section.contains(name))
    return;
  const json &value = section[name];
  if (value.is_number_unsigned()) {
    auto count = value.get<std::uint64_t>();
    if (count <= static_cast<std::uint64_t>(std::numeric_limits<int>::max()))
      field = static_cast<int>(count);
  } else if (value.is_number_integer()) {
    auto count = value.get<std::int64_t>();
    if (count >= 0 && count <= std::numeric_limits<int>::max())
      field = static_cast<int>(count);
  }
}

void fillFromEnv(std::string &field, const char *name) {
  if (!field.empty())
    return;
  const char *env = std::getenv(name);
  if (env)
    field = env;
}

} // namespace

ObfuscationMethod parseObfuscationMethod(const std::string &name) {
  std::string lower = text::TextProcessor::toLower(name);
  if (lower == "hash")
    return ObfuscationMethod::Hash;
  if (lower == "mask")
    return ObfuscationMethod::Mask;
  if (lower == "vault")
    return ObfuscationMethod::Vault;
  if (lower == "anonymize")
    return ObfuscationMethod::Anonymize;
  throw ConfigError("unknown obfuscation method: " + name);
}

std::string toString(ObfuscationMethod method) {
  switch (method) {
  case ObfuscationMethod::Hash:
    return "HASH";
  case ObfuscationMethod::Mask:
    return "MASK";
  case ObfuscationMethod::Vault:
    return "VAULT";
  case ObfuscationMethod::Anonymize:
    return "ANONYMIZE";
  }
  return "HASH";
}

void applyConfig(const json &root, OpaqueConfig &config) {
  if (!root.is_object())
    return;

  if (root.contains("scanner") && root["scanner"].is_object()) {
    const auto &scanner = root["scanner"];
    if (scanner.contains("rules") && scanner["rules"].is_array()) {
      std::vector<std::string> rules = stringList(scanner["rules"]);
      for (const auto &id : rules) {
        if (!validators::find(id))
          throw ConfigError("unknown rule: " + id);
      }
      config.scanner.rules = rules;
    }
    if (scanner.contains("method") && scanner["method"].is_string()) {
      config.scanner.method =
          parseObfuscationMethod(scanner["method"].get<std::string>());
    }
    if (scanner.contains("vaultKey") && scanner["vaultKey"].is_string()) {
      config.scanner.vaultKey = scanner["vaultKey"].get<std::string>();
    }
    if (scanner.contains("salt") && scanner["salt"].is_string()) {
      config.scanner.salt = scanner["salt"].get<std::string>();
    }
    if (scanner.contains("secretKey") && scanner["secretKey"].is_string()) {
      config.scanner.secretKey = scanner["secretKey"].get<std::string>();
    }
    if (scanner.contains("honeytokens") && scanner["honeytokens"].is_array()) {
      config.scanner.honeytokens = stringList(scanner["honeytokens"]);
    }
    if (scanner.contains("honeytokenWebhook") &&
        scanner["honeytokenWebhook"].is_string()) {
      config.scanner.honeytokenWebhook =
          scanner["honeytokenWebhook"].get<std::string>();
    }
    readCount(scanner, "circuitThreshold", config.scanner.circuitThreshold);
    readCount(scanner, "floodMatchesPerRule",
              config.scanner.floodMatchesPerRule);
    readCount(scanner, "circuitResetMs", config.scanner.circuitResetMs);
  }

  if (root.contains("audit") && root["audit"].is_object()) {
    const auto &audit = root["audit"];
    if (audit.contains("output") && audit["output"].is_string()) {
      config.audit.output = audit["output"].get<std::string>();
    }
  }

  if (root.contains("log") && root["log"].is_object()) {
    const auto &log = root["log"];
    if (log.contains("level") && log["level"].is_string()) {
      config.log.level = log["level"].get<std::string>();
    }
  }
}

OpaqueConfig parseConfig(const json &root) {
  OpaqueConfig config;
  applyConfig(root, config);
  return config;
}

OpaqueConfig loadConfigFile(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw ConfigError("cannot open config file: " + path);

  json root;
  try {
    root = json::parse(in);
  } catch (const json::parse_error &e) {
    throw ConfigError("invalid JSON in " + path + ": " + e.what());
  }
  return parseConfig(root);
}

void applyEnvironment(OpaqueConfig &config) {
  fillFromEnv(config.scanner.salt, "OPAQUE_SALT");
  fillFromEnv(config.scanner.vaultKey, "OPAQUE_MASTER_KEY");
  fillFromEnv(config.scanner.secretKey, "OPAQUE_SECRET_KEY");
}

} // namespace Opaque
