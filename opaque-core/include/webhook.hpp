#pragma once

#include "callbacks.hpp"

#include <future>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Opaque {
namespace webhook {

struct DeliveryResult {
  long response_code;
  std::string content;
  bool success;

  DeliveryResult(long code, const std::string &data)
      : response_code(code), content(data),
        success(code >= 200 && code < 300) {}
};

json buildAlertPayload(const std::string &data, const json &context);

// POSTs `payload` as JSON on a background thread. Network failures resolve
// to response code -1.
std::future<DeliveryResult> postAlert(const std::string &url,
                                      const json &payload);

std::string getErrorMessage(long response_code);

// Honeytoken handler that reports detections to a SIEM/SOC webhook
class WebhookHoneytokenHandler : public HoneytokenHandler {
public:
  WebhookHoneytokenHandler(const std::string &url,
                           const std::vector<std::string> &tokens);

  bool isHoneytoken(const std::string &data) override;
  void onDetected(const std::string &data, const json &context) override;
  std::vector<std::string> knownTokens() const override;
  void flush(std::chrono::milliseconds timeout) override;

  // Blocks until every alert sent so far has been delivered or failed
  std::vector<DeliveryResult> drain();

  // Alerts not yet collected. Finished ones are collected on the next
  // detection.
  size_t pendingCount() const;

private:
  // Caller holds pending_mutex_
  void collectFinished();

  std::string url_;
  std::set<std::string> tokens_;
  mutable std::mutex pending_mutex_;
  std::vector<std::future<DeliveryResult>> pending_;
};

} // namespace webhook
} // namespace Opaque
