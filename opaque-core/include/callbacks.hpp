#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace Opaque {

using json = nlohmann::json;

// Replacement text for a confirmed value, e.g. "[HASH-3A4C]"
using HashFunction = std::function<std::string(const std::string &)>;

// Reversible protection (encryption, external tokenization services, HSMs)
class VaultInterface {
public:
  virtual ~VaultInterface() = default;

  virtual std::string encrypt(const std::string &data) = 0;
  virtual std::string decrypt(const std::string &encrypted) = 0;
};

// Decides whether a value is a planted honeytoken and reacts to it.
class HoneytokenHandler {
public:
  virtual ~HoneytokenHandler() = default;

  virtual bool isHoneytoken(const std::string &data) = 0;

  // `context` carries at least "rule" (or "literal") and "timestamp"
  virtual void onDetected(const std::string &data, const json &context) = 0;

  // Literal tokens the scanner searches for as plain substrings, before any
  // rule runs
  virtual std::vector<std::string> knownTokens() const { return {}; }

  // Waits up to `timeout` for alerts that are still being delivered
  virtual void flush(std::chrono::milliseconds) {}
};

class AnonymizationStrategy {
public:
  virtual ~AnonymizationStrategy() = default;

  // `entity` is the rule's entity name ("CPF", "IBAN", ...)
  virtual std::string anonymize(const std::string &data,
                                const std::string &entity) = 0;

  // True for pseudonymization that can be undone with extra information
  virtual bool canReverse() const = 0;
};

class SimpleHoneytokenHandler : public HoneytokenHandler {
public:
  using AlertCallback =
      std::function<void(const std::string &, const json &)>;

  explicit SimpleHoneytokenHandler(const std::vector<std::string> &tokens,
                                   AlertCallback callback = nullptr,
                                   std::ostream &alerts = std::cerr);

  bool isHoneytoken(const std::string &data) override;
  void onDetected(const std::string &data, const json &context) override;
  std::vector<std::string> knownTokens() const override;

private:
  std::set<std::string> tokens_;
  AlertCallback callback_;
  std::ostream &alerts_;
};

// Random tag per occurrence. Nothing links two occurrences of the same value.
class IrreversibleAnonymizer : public AnonymizationStrategy {
public:
  std::string anonymize(const std::string &data,
                        const std::string &entity) override;
  bool canReverse() const override { return false; }
};

// HMAC-SHA256 keyed tag. Equal values give equal tags, so logs still
// correlate; the output is pseudonymous, not anonymous.
class DeterministicPseudonymizer : public AnonymizationStrategy {
public:
  // Empty key falls back to $OPAQUE_SECRET_KEY, then to a fixed default
  explicit DeterministicPseudonymizer(const std::string &secretKey = "");

  std::string anonymize(const std::string &data,
                        const std::string &entity) override;
  bool canReverse() const override { return false; }

private:
  std::string secretKey_;
};

} // namespace Opaque
