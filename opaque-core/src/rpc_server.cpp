#include "rpc_server.hpp"
#include "validators.hpp"

#include <cstdlib>
#include <iostream>
#include <stdexcept>

static bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("OPAQUE_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

namespace Opaque {

namespace {

std::string stringParam(const json &params, const char *name) {
  if (!params.is_object() || !params.contains(name) ||
      !params[name].is_string()) {
    throw binding::BindingError(
        binding::ErrorKind::TypeError,
        std::string("missing string parameter '") + name + "'");
  }
  return params[name].get<std::string>();
}

} // namespace

RpcServer::RpcServer(std::istream &in, std::ostream &out,
                     const OpaqueConfig &config)
    : in_(in), out_(out), config_(config), core_(binding::makeCoreModule()) {
  rebuildScanner();
}

bool RpcServer::readMessage(std::string &jsonPayload) {
  // Headers up to the blank line, then exactly Content-Length bytes
  std::string line;
  size_t contentLength = 0;

  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("Content-Length:", 0) == 0) {
      try {
        contentLength = static_cast<size_t>(std::stoul(line.substr(15)));
      } catch (const std::logic_error &) {
        contentLength = 0;
      }
    }
    if (line.empty())
      break;
  }

  if (!contentLength || !in_.good())
    return false;

  jsonPayload.resize(contentLength);
  in_.read(&jsonPayload[0], static_cast<std::streamsize>(contentLength));
  return in_.gcount() == static_cast<std::streamsize>(contentLength);
}

void RpcServer::reply(const json &msg) {
  std::string payload = msg.dump();
  out_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
  out_.flush();
}

void RpcServer::replyError(const json &id, int code,
                           const std::string &message) {
  reply(json{{"jsonrpc", "2.0"},
             {"id", id},
             {"error", {{"code", code}, {"message", message}}}});
}

void RpcServer::notify(const std::string &method, const json &params) {
  json msg = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
  reply(msg);
}

void RpcServer::flushAlerts() {
  for (const auto &alert : pendingAlerts_) {
    notify("opaque/honeytoken", alert);
  }
  pendingAlerts_.clear();
}

void RpcServer::rebuildScanner() {
  Callbacks callbacks;
  if (!config_.scanner.honeytokens.empty()) {
    // Alerts travel as notifications; stdout belongs to the protocol
    callbacks.honeytokenHandler = std::make_shared<SimpleHoneytokenHandler>(
        config_.scanner.honeytokens,
        [this](const std::string &data, const json &context) {
          pendingAlerts_.push_back(json{{"data", data}, {"context", context}});
        });
  }
  scanner_ = std::make_shared<Scanner>(config_.scanner, std::move(callbacks));
  vault_.reset();
}

void RpcServer::handle(const json &req) {
  if (!req.is_object() || !req.contains("method") ||
      !req["method"].is_string()) {
    return;
  }
  const bool isRequest = req.contains("id");
  const json id = isRequest ? req["id"] : json();
  const std::string method = req["method"].get<std::string>();
  const json params = req.value("params", json::object());

  try {
    json result;
    const std::string corePrefix = core_.name() + "/";

    if (method == "initialize") {
      result = onInitialize(params);
    } else if (method == "initialized") {
      return;
    } else if (method.rfind(corePrefix, 0) == 0) {
      result = core_.call(method.substr(corePrefix.size()), params);
    } else if (method == "opaque/sanitize") {
      result = onSanitize(params);
    } else if (method == "opaque/analyze") {
      result = onAnalyze(params);
    } else if (method == "opaque/sanitizeStructure") {
      result = onSanitizeStructure(params);
    } else if (method == "opaque/validate") {
      result = onValidate(params);
    } else if (method == "opaque/reveal") {
      result = onReveal(params);
    } else if (method == "shutdown") {
      result = nullptr;
    } else if (method == "exit") {
      running_ = false;
      return;
    } else {
      if (isRequest)
        replyError(id, kMethodNotFound, "method not found: " + method);
      return;
    }

    flushAlerts();
    if (isRequest)
      reply(json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
  } catch (const binding::BindingError &e) {
    flushAlerts();
    if (isRequest) {
      int code = e.kind() == binding::ErrorKind::LookupError ? kMethodNotFound
                                                             : kInvalidParams;
      replyError(id, code,
                 std::string(binding::kindName(e.kind())) + ": " + e.what());
    }
  } catch (const ConfigError &e) {
    if (isRequest)
      replyError(id, kInvalidParams, e.what());
  } catch (const std::out_of_range &e) {
    if (isRequest)
      replyError(id, kInvalidParams, e.what());
  } catch (const std::exception &e) {
    pendingAlerts_.clear();
    if (isRequest)
      replyError(id, kInternalError, e.what());
  }
}

void RpcServer::run() {
  std::string jsonPayload;
  while (running_ && readMessage(jsonPayload)) {
    try {
      json req = json::parse(jsonPayload);
      handle(req);
    } catch (const json::parse_error &e) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] JSON parse error: " << e.what() << std::endl;
      }
    }
  }
}

json RpcServer::onInitialize(const json &params) {
  if (params.contains("initializationOptions") &&
      params["initializationOptions"].is_object()) {
    OpaqueConfig updated = config_;
    applyConfig(params["initializationOptions"], updated);
    applyEnvironment(updated);
    config_ = updated;
    rebuildScanner();
  }

  json rules = json::array();
  for (const auto &rule : validators::catalog()) {
    rules.push_back(rule.id);
  }

  return json{{"capabilities",
               {{"modules", {{core_.name(), core_.functionNames()}}},
                {"methods",
                 {"opaque/sanitize", "opaque/analyze",
                  "opaque/sanitizeStructure", "opaque/validate",
                  "opaque/reveal"}},
                {"rules", rules}}},
              {"serverInfo", {{"name", "opaque"}}}};
}

json RpcServer::onSanitize(const json &params) {
  return scanner_->sanitize(binding::textArgument(params));
}

json RpcServer::onAnalyze(const json &params) {
  json findings = json::array();
  for (const auto &finding : scanner_->analyze(binding::textArgument(params))) {
    findings.push_back(toJson(finding));
  }
  return findings;
}

json RpcServer::onSanitizeStructure(const json &params) {
  if (!params.is_object() || !params.contains("data")) {
    throw binding::BindingError(binding::ErrorKind::TypeError,
                                "missing parameter 'data'");
  }
  return scanner_->processStructure(params["data"]);
}

json RpcServer::onValidate(const json &params) {
  std::string rule = stringParam(params, "rule");
  std::string value = stringParam(params, "value");
  return json{{"rule", rule}, {"valid", validators::validate(rule, value)}};
}

json RpcServer::onReveal(const json &params) {
  std::string token = stringParam(params, "token");
  if (!vault_) {
    vault_ = std::make_unique<Vault>(config_.scanner.vaultKey);
  }
  return vault_->decrypt(token);
}

} // namespace Opaque
