#include "scanner.hpp"
#include "fingerprint.hpp"
#include "logger.hpp"
#include "text_processor.hpp"
#include "vault.hpp"
#include "webhook.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <regex>

namespace Opaque {

namespace {

bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("OPAQUE_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

long long unixTime() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

struct Match {
  size_t start;
  size_t length;
};

std::vector<Match> findMatches(const std::regex &pattern,
                               const std::string &text) {
  std::vector<Match> matches;
  for (auto it = std::sregex_iterator(text.begin(), text.end(), pattern);
       it != std::sregex_iterator(); ++it) {
    if (it->length(0) == 0)
      continue;
    matches.push_back({static_cast<size_t>(it->position(0)),
                       static_cast<size_t>(it->length(0))});
  }
  return matches;
}

} // namespace

const char *const Scanner::kFloodMessage =
    "[OPAQUE: LOG FLOOD PROTECTION ACTIVATED - DATA DISCARDED]";
const char *const Scanner::kHoneytokenReplacement = "[HONEYTOKEN TRIGGERED]";
const char *const Scanner::kMaskReplacement = "***";

json toJson(const Finding &finding) {
  return json{{"rule", finding.ruleId},
              {"entity", finding.entity},
              {"start", finding.start},
              {"end", finding.end},
              {"line", finding.position.line},
              {"character", finding.position.character},
              {"text", finding.text},
              {"valid", finding.valid},
              {"score", finding.score}};
}

Scanner::Scanner(const ScannerConfig &config, Callbacks callbacks)
    : config_(config), hash_(std::move(callbacks.hashFunction)),
      vault_(std::move(callbacks.vault)),
      honeytokens_(std::move(callbacks.honeytokenHandler)),
      anonymizer_(std::move(callbacks.anonymizer)),
      last_reset_(std::chrono::steady_clock::now()) {
  if (config_.circuitThreshold < 0 || config_.floodMatchesPerRule < 0 ||
      config_.circuitResetMs < 0) {
    throw ConfigError("circuit breaker settings must not be negative");
  }
  for (const auto &id : config_.rules) {
    const validators::Rule *rule = validators::find(id);
    if (!rule)
      throw ConfigError("unknown rule: " + id);
    rules_.push_back(rule);
  }

  if (!hash_) {
    hash_ = Fingerprinter(config_.salt);
  }
  if (!vault_ && config_.method == ObfuscationMethod::Vault) {
    vault_ = std::make_shared<Vault>(config_.vaultKey);
  }
  if (!honeytokens_ && !config_.honeytokens.empty()) {
    if (!config_.honeytokenWebhook.empty()) {
      honeytokens_ = std::make_shared<webhook::WebhookHoneytokenHandler>(
          config_.honeytokenWebhook, config_.honeytokens);
    } else {
      honeytokens_ =
          std::make_shared<SimpleHoneytokenHandler>(config_.honeytokens);
    }
  }
  if (!anonymizer_) {
    if (!config_.secretKey.empty()) {
      anonymizer_ =
          std::make_shared<DeterministicPseudonymizer>(config_.secretKey);
    } else {
      anonymizer_ = std::make_shared<IrreversibleAnonymizer>();
    }
  }
}

std::string Scanner::sanitize(const std::string &text) {
  if (circuitBlocks())
    return kFloodMessage;

  std::string processed = text;

  if (honeytokens_) {
    for (const auto &token : honeytokens_->knownTokens()) {
      if (text::TextProcessor::replaceAll(processed, token,
                                          kHoneytokenReplacement) > 0) {
        notifyHoneytoken(token, json{{"literal", true}});
      }
    }
  }

  for (const validators::Rule *rule : rules_) {
    std::vector<Match> matches = findMatches(rule->pattern, processed);

    if (recordMatches(matches.size())) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] circuit breaker opened by rule " << rule->id
                  << " (" << matches.size() << " matches)" << std::endl;
      }
      return kFloodMessage;
    }

    // Back to front so earlier offsets stay valid
    for (auto it = matches.rbegin(); it != matches.rend(); ++it) {
      std::string candidate = processed.substr(it->start, it->length);

      std::string replacement;
      if (honeytokens_ && honeytokens_->isHoneytoken(candidate)) {
        replacement = kHoneytokenReplacement;
        notifyHoneytoken(candidate, json{{"rule", rule->id}});
      } else if (rule->validate(candidate)) {
        replacement = obfuscate(*rule, candidate);
      } else {
        log::securityLogger().warning(
            "OPAQUE WARNING: Pattern matched for " + rule->entity +
            " but validation failed for '" + candidate +
            "'. Possible fake data.");
        continue;
      }

      processed.replace(it->start, it->length, replacement);
    }
  }

  return processed;
}

std::vector<Finding> Scanner::analyze(const std::string &text) const {
  std::vector<Finding> findings;
  std::vector<size_t> lineStarts = computeLineStarts(text);

  for (const validators::Rule *rule : rules_) {
    for (const Match &match : findMatches(rule->pattern, text)) {
      Finding finding;
      finding.ruleId = rule->id;
      finding.entity = rule->entity;
      finding.start = match.start;
      finding.end = match.start + match.length;
      finding.position = byteOffsetToPosition(text, lineStarts, match.start);
      finding.text = text.substr(match.start, match.length);
      finding.valid = rule->validate(finding.text);
      finding.score = finding.valid ? 1.0 : 0.0;
      findings.push_back(std::move(finding));
    }
  }

  std::stable_sort(findings.begin(), findings.end(),
                   [](const Finding &a, const Finding &b) {
                     return a.start < b.start;
                   });
  return findings;
}

json Scanner::processStructure(const json &data) {
  if (data.is_object()) {
    json result = json::object();
    for (auto it = data.begin(); it != data.end(); ++it) {
      result[it.key()] = processStructure(it.value());
    }
    return result;
  }
  if (data.is_array()) {
    json result = json::array();
    for (const auto &item : data) {
      result.push_back(processStructure(item));
    }
    return result;
  }
  if (data.is_string()) {
    return sanitize(data.get<std::string>());
  }
  return data;
}

bool Scanner::isCircuitOpen() const {
  std::lock_guard<std::mutex> lock(breaker_mutex_);
  return circuit_open_;
}

int Scanner::errorCount() const {
  std::lock_guard<std::mutex> lock(breaker_mutex_);
  return error_count_;
}

void Scanner::flushAlerts(std::chrono::milliseconds timeout) {
  if (honeytokens_)
    honeytokens_->flush(timeout);
}

bool Scanner::circuitBlocks() {
  std::lock_guard<std::mutex> lock(breaker_mutex_);
  if (!circuit_open_)
    return false;

  auto elapsed = std::chrono::steady_clock::now() - last_reset_;
  if (elapsed > std::chrono::milliseconds(config_.circuitResetMs)) {
    circuit_open_ = false;
    error_count_ = 0;
    return false;
  }
  return true;
}

bool Scanner::recordMatches(size_t matchCount) {
  std::lock_guard<std::mutex> lock(breaker_mutex_);
  // A single line with this many hits is treated as a flood
  if (matchCount > static_cast<size_t>(config_.floodMatchesPerRule)) {
    size_t room = static_cast<size_t>(std::numeric_limits<int>::max() -
                                      error_count_);
    error_count_ += static_cast<int>(std::min(matchCount, room));
  }
  if (error_count_ > config_.circuitThreshold) {
    circuit_open_ = true;
    last_reset_ = std::chrono::steady_clock::now();
    return true;
  }
  return false;
}

std::string Scanner::obfuscate(const validators::Rule &rule,
                               const std::string &candidate) {
  switch (config_.method) {
  case ObfuscationMethod::Hash:
    return hash_(candidate);
  case ObfuscationMethod::Vault:
    if (vault_)
      return vault_->encrypt(candidate);
    break;
  case ObfuscationMethod::Anonymize:
    return anonymizer_->anonymize(candidate, rule.entity);
  case ObfuscationMethod::Mask:
    break;
  }
  return kMaskReplacement;
}

void Scanner::notifyHoneytoken(const std::string &token, const json &context) {
  json full = context;
  full["timestamp"] = unixTime();
  honeytokens_->onDetected(token, full);
}

} // namespace Opaque
