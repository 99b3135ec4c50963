#pragma once

#include "binding.hpp"
#include "config.hpp"
#include "scanner.hpp"
#include "vault.hpp"

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace Opaque {

// JSON-RPC 2.0 over Content-Length framed streams (the LSP base protocol)
class RpcServer {
public:
  static constexpr int kMethodNotFound = -32601;
  static constexpr int kInvalidParams = -32602;
  static constexpr int kInternalError = -32603;

  RpcServer(std::istream &in, std::ostream &out,
            const OpaqueConfig &config = OpaqueConfig{});

  // Serves until the input ends or an "exit" notification arrives
  void run();

  // Dispatches one parsed message. Exposed for tests.
  void handle(const json &req);

  bool running() const { return running_; }

private:
  std::istream &in_;
  std::ostream &out_;

  OpaqueConfig config_;
  binding::Module core_;
  std::shared_ptr<Scanner> scanner_;
  std::unique_ptr<Vault> vault_;
  std::vector<json> pendingAlerts_;
  bool running_{true};

  bool readMessage(std::string &jsonPayload);
  void reply(const json &msg);
  void replyError(const json &id, int code, const std::string &message);
  void notify(const std::string &method, const json &params);
  void flushAlerts();

  void rebuildScanner();

  json onInitialize(const json &params);
  json onSanitize(const json &params);
  json onAnalyze(const json &params);
  json onSanitizeStructure(const json &params);
  json onValidate(const json &params);
  json onReveal(const json &params);
};

} // namespace Opaque
