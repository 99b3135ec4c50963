#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace Opaque {
namespace binding {

using json = nlohmann::json;

enum class ErrorKind { TypeError, EncodingError, LookupError };

const char *kindName(ErrorKind kind);

// Failure at the host/native boundary. Nothing past the boundary fails.
class BindingError : public std::runtime_error {
public:
  BindingError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

using Callable = std::function<json(const json &args)>;

// Named registry of native functions reachable from a host runtime
class Module {
public:
  explicit Module(const std::string &name) : name_(name) {}

  const std::string &name() const { return name_; }

  void addFunction(const std::string &function, Callable callable);
  bool hasFunction(const std::string &function) const;
  std::vector<std::string> functionNames() const;

  // Throws BindingError(LookupError) for unregistered names
  json call(const std::string &function, const json &args) const;

private:
  std::string name_;
  std::map<std::string, Callable> functions_;
};

// Identity: the output is byte-for-byte the input
std::string sanitize(const std::string &text);

// Accepts "text", ["text"] or {"text": "text"}. Throws BindingError
// (TypeError) for anything else and (EncodingError) for invalid UTF-8.
std::string textArgument(const json &args);

// Module "opaque_core" with "sanitize" registered
Module makeCoreModule();

} // namespace binding
} // namespace Opaque
