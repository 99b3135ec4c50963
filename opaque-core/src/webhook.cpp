#include "webhook.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include <thread>

namespace Opaque {
namespace webhook {

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

size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
  size_t totalSize = size * nmemb;
  std::string *buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<char *>(contents), totalSize);
  return totalSize;
}

struct AsyncRequest {
  CURL *easy_handle;
  curl_slist *headers;
  std::string body;
  std::string response_buffer;
  std::promise<DeliveryResult> promise;

  AsyncRequest() : easy_handle(nullptr), headers(nullptr) {}
  ~AsyncRequest() {
    if (easy_handle) {
      curl_easy_cleanup(easy_handle);
    }
    if (headers) {
      curl_slist_free_all(headers);
    }
  }
};

} // namespace

json buildAlertPayload(const std::string &data, const json &context) {
  return json{{"severity", "CRITICAL"},
              {"type", "honeytoken_access"},
              {"data", data},
              {"context", context}};
}

std::string getErrorMessage(long response_code) {
  switch (response_code) {
  case -1:
    return "Network connection error";
  case 401:
    return "Unauthorized";
  case 403:
    return "Access forbidden";
  case 404:
    return "Webhook endpoint not found";
  case 500:
    return "Internal server error";
  case 502:
    return "Bad gateway";
  case 503:
    return "Service unavailable";
  case 504:
    return "Gateway timeout";
  default:
    return "HTTP error: " + std::to_string(response_code);
  }
}

std::future<DeliveryResult> postAlert(const std::string &url,
                                      const json &payload) {
  auto request = std::make_shared<AsyncRequest>();
  request->body = payload.dump();
  auto future = request->promise.get_future();

  std::thread([request, url]() {
    CURLM *multi_handle = curl_multi_init();
    if (!multi_handle) {
      request->promise.set_value(
          DeliveryResult(-1, "Failed to initialize curl multi handle"));
      return;
    }

    request->easy_handle = curl_easy_init();
    if (!request->easy_handle) {
      curl_multi_cleanup(multi_handle);
      request->promise.set_value(
          DeliveryResult(-1, "Failed to initialize curl easy handle"));
      return;
    }

    request->headers =
        curl_slist_append(request->headers, "Content-Type: application/json");

    curl_easy_setopt(request->easy_handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(request->easy_handle, CURLOPT_HTTPHEADER,
                     request->headers);
    curl_easy_setopt(request->easy_handle, CURLOPT_POSTFIELDS,
                     request->body.c_str());
    curl_easy_setopt(request->easy_handle, CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(request->body.size()));
    curl_easy_setopt(request->easy_handle, CURLOPT_WRITEFUNCTION,
                     WriteCallback);
    curl_easy_setopt(request->easy_handle, CURLOPT_WRITEDATA,
                     &request->response_buffer);
    curl_easy_setopt(request->easy_handle, CURLOPT_TIMEOUT, 5L);
    curl_easy_setopt(request->easy_handle, CURLOPT_CONNECTTIMEOUT, 3L);
    curl_easy_setopt(request->easy_handle, CURLOPT_USERAGENT,
                     "opaque-honeytoken-alert/0.1");

    curl_multi_add_handle(multi_handle, request->easy_handle);

    bool failed = false;
    int still_running = 0;
    do {
      CURLMcode mc = curl_multi_perform(multi_handle, &still_running);
      if (mc != CURLM_OK) {
        failed = true;
        break;
      }

      if (still_running) {
        curl_multi_wait(multi_handle, nullptr, 0, 100, nullptr);
      }
    } while (still_running > 0);

    long response_code = 0;
    curl_easy_getinfo(request->easy_handle, CURLINFO_RESPONSE_CODE,
                      &response_code);
    // No HTTP status at all means the connection never completed
    if (failed || response_code == 0) {
      response_code = -1;
    }

    curl_multi_remove_handle(multi_handle, request->easy_handle);
    curl_multi_cleanup(multi_handle);

    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] honeytoken alert to " << url
                << " finished with status " << response_code << std::endl;
    }

    if (response_code >= 200 && response_code < 300) {
      request->promise.set_value(
          DeliveryResult(response_code, request->response_buffer));
    } else {
      request->promise.set_value(
          DeliveryResult(response_code, getErrorMessage(response_code)));
    }
  }).detach();

  return future;
}

WebhookHoneytokenHandler::WebhookHoneytokenHandler(
    const std::string &url, const std::vector<std::string> &tokens)
    : url_(url), tokens_(tokens.begin(), tokens.end()) {}

bool WebhookHoneytokenHandler::isHoneytoken(const std::string &data) {
  return tokens_.count(data) > 0;
}

void WebhookHoneytokenHandler::onDetected(const std::string &data,
                                          const json &context) {
  std::cerr << "ALERT: HONEYTOKEN DETECTED: " << data << std::endl;
  auto future = postAlert(url_, buildAlertPayload(data, context));
  std::lock_guard<std::mutex> lock(pending_mutex_);
  collectFinished();
  pending_.push_back(std::move(future));
}

void WebhookHoneytokenHandler::flush(std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  std::lock_guard<std::mutex> lock(pending_mutex_);
  for (auto &future : pending_) {
    if (future.wait_until(deadline) != std::future_status::ready) {
      std::cerr << "honeytoken alert to " << url_
                << " still in flight after flush timeout" << std::endl;
      break;
    }
  }
}

size_t WebhookHoneytokenHandler::pendingCount() const {
  std::lock_guard<std::mutex> lock(pending_mutex_);
  return pending_.size();
}

void WebhookHoneytokenHandler::collectFinished() {
  auto finished = [](std::future<DeliveryResult> &future) {
    return future.wait_for(std::chrono::seconds(0)) ==
           std::future_status::ready;
  };
  for (auto &future : pending_) {
    if (!finished(future))
      continue;
    DeliveryResult result = future.get();
    if (!result.success && isDebugEnabled()) {
      std::cerr << "[DEBUG] honeytoken alert failed: " << result.content
                << std::endl;
    }
  }
  pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                [](const std::future<DeliveryResult> &f) {
                                  return !f.valid();
                                }),
                 pending_.end());
}

std::vector<std::string> WebhookHoneytokenHandler::knownTokens() const {
  return std::vector<std::string>(tokens_.begin(), tokens_.end());
}

std::vector<DeliveryResult> WebhookHoneytokenHandler::drain() {
  std::vector<std::future<DeliveryResult>> pending;
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    pending.swap(pending_);
  }

  std::vector<DeliveryResult> results;
  results.reserve(pending.size());
  for (auto &future : pending) {
    results.push_back(future.get());
  }
  return results;
}

} // namespace webhook
} // namespace Opaque
