#include "binding.hpp"
#include "text_processor.hpp"

namespace Opaque {
namespace binding {

const char *kindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::TypeError:
    return "TypeError";
  case ErrorKind::EncodingError:
    return "EncodingError";
  case ErrorKind::LookupError:
    return "LookupError";
  }
  return "BindingError";
}

void Module::addFunction(const std::string &function, Callable callable) {
  functions_[function] = std::move(callable);
}

bool Module::hasFunction(const std::string &function) const {
  return functions_.find(function) != functions_.end();
}

std::vector<std::string> Module::functionNames() const {
  std::vector<std::string> names;
  names.reserve(functions_.size());
  for (const auto &entry : functions_) {
    names.push_back(entry.first);
  }
  return names;
}

json Module::call(const std::string &function, const json &args) const {
  auto it = functions_.find(function);
  if (it == functions_.end()) {
    throw BindingError(ErrorKind::LookupError,
                       "module '" + name_ + "' has no function '" + function +
                           "'");
  }
  return it->second(args);
}

std::string sanitize(const std::string &text) { return text; }

std::string textArgument(const json &args) {
  const json *value = &args;
  if (args.is_array()) {
    if (args.size() != 1) {
      throw BindingError(ErrorKind::TypeError,
                         "expected exactly 1 argument, got " +
                             std::to_string(args.size()));
    }
    value = &args[0];
  } else if (args.is_object()) {
    auto it = args.find("text");
    if (it == args.end()) {
      throw BindingError(ErrorKind::TypeError, "missing argument 'text'");
    }
    value = &*it;
  }

  if (!value->is_string()) {
    throw BindingError(ErrorKind::TypeError,
                       std::string("argument 'text' must be str, not ") +
                           value->type_name());
  }

  const std::string &text = value->get_ref<const std::string &>();
  if (!text::TextProcessor::isValidUTF8(text)) {
    throw BindingError(ErrorKind::EncodingError,
                       "argument 'text' is not valid UTF-8");
  }
  return text;
}

Module makeCoreModule() {
  Module module("opaque_core");
  module.addFunction("sanitize", [](const json &args) -> json {
    return sanitize(textArgument(args));
  });
  return module;
}

} // namespace binding
} // namespace Opaque
