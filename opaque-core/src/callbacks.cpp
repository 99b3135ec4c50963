#include "callbacks.hpp"
#include "crypto.hpp"

#include <cstdlib>

namespace Opaque {

SimpleHoneytokenHandler::SimpleHoneytokenHandler(
    const std::vector<std::string> &tokens, AlertCallback callback,
    std::ostream &alerts)
    : tokens_(tokens.begin(), tokens.end()), callback_(std::move(callback)),
      alerts_(alerts) {}

bool SimpleHoneytokenHandler::isHoneytoken(const std::string &data) {
  return tokens_.count(data) > 0;
}

void SimpleHoneytokenHandler::onDetected(const std::string &data,
                                         const json &context) {
  alerts_ << "ALERT: HONEYTOKEN DETECTED: " << data << std::endl;
  if (callback_) {
    callback_(data, context);
  }
}

std::vector<std::string> SimpleHoneytokenHandler::knownTokens() const {
  return std::vector<std::string>(tokens_.begin(), tokens_.end());
}

std::string IrreversibleAnonymizer::anonymize(const std::string &,
                                              const std::string &) {
  return "[ANON-" + crypto::toHex(crypto::randomBytes(4), true) + "]";
}

DeterministicPseudonymizer::DeterministicPseudonymizer(
    const std::string &secretKey)
    : secretKey_(secretKey) {
  if (secretKey_.empty()) {
    const char *env = std::getenv("OPAQUE_SECRET_KEY");
    secretKey_ = (env && *env) ? env : "change_me_insecure_default";
  }
}

std::string DeterministicPseudonymizer::anonymize(const std::string &data,
                                                  const std::string &entity) {
  std::string mac = crypto::hmacSha256(secretKey_, entity + ":" + data);
  return "[PSEUDO-" + crypto::toHex(mac, true).substr(0, 8) + "]";
}

} // namespace Opaque
