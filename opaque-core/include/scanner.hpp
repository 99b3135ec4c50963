#pragma once

#include "callbacks.hpp"
#include "config.hpp"
#include "utf16.hpp"
#include "validators.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace Opaque {

// Injected extension points. Empty members fall back to the built-ins:
// Fingerprinter, Vault, a honeytoken handler when the config lists tokens
// (webhook or stderr alerts), and DeterministicPseudonymizer when a secret
// key is configured, IrreversibleAnonymizer otherwise.
struct Callbacks {
  HashFunction hashFunction;
  std::shared_ptr<VaultInterface> vault;
  std::shared_ptr<HoneytokenHandler> honeytokenHandler;
  std::shared_ptr<AnonymizationStrategy> anonymizer;
};

struct Finding {
  std::string ruleId;
  std::string entity;
  size_t start{0}; // byte offsets into the analyzed text
  size_t end{0};
  Position position;
  std::string text;
  bool valid{false};
  double score{0.0};
};

json toJson(const Finding &finding);

class Scanner {
public:
  static const char *const kFloodMessage;
  static const char *const kHoneytokenReplacement;
  static const char *const kMaskReplacement;

  // Throws ConfigError for unknown rule ids and negative breaker settings
  explicit Scanner(const ScannerConfig &config, Callbacks callbacks = {});

  // Replaces every mathematically valid match of the enabled rules
  std::string sanitize(const std::string &text);

  // Reports matches without replacing anything or touching the breaker
  std::vector<Finding> analyze(const std::string &text) const;

  // Sanitizes every string inside objects and arrays
  json processStructure(const json &data);

  bool isCircuitOpen() const;
  int errorCount() const;

  // Gives in-flight honeytoken alerts up to `timeout` to be delivered
  void flushAlerts(std::chrono::milliseconds timeout);

  const ScannerConfig &config() const { return config_; }

private:
  // True when the breaker is open; closes it once the reset interval passed
  bool circuitBlocks();

  // Adds a rule's match count to the flood counter. True when that trips
  // the breaker.
  bool recordMatches(size_t matchCount);

  std::string obfuscate(const validators::Rule &rule,
                        const std::string &candidate);

  void notifyHoneytoken(const std::string &token, const json &context);

  ScannerConfig config_;
  std::vector<const validators::Rule *> rules_;

  HashFunction hash_;
  std::shared_ptr<VaultInterface> vault_;
  std::shared_ptr<HoneytokenHandler> honeytokens_;
  std::shared_ptr<AnonymizationStrategy> anonymizer_;

  mutable std::mutex breaker_mutex_;
  int error_count_{0};
  bool circuit_open_{false};
  std::chrono::steady_clock::time_point last_reset_;
};

} // namespace Opaque
