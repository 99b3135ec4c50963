#include "crash_handler.hpp"
#include "text_processor.hpp"

#include <cstdlib>
#include <cxxabi.h>
#include <typeinfo>

namespace Opaque {

namespace {

std::shared_ptr<CrashHandler> &installedHandler() {
  static std::shared_ptr<CrashHandler> handler;
  return handler;
}

std::string demangle(const char *name) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(
      abi::__cxa_demangle(name, nullptr, nullptr, &status), std::free);
  if (status == 0 && demangled)
    return demangled.get();
  return name;
}

void onTerminate() {
  std::exception_ptr current = std::current_exception();
  if (current && installedHandler()) {
    installedHandler()->report(current);
  }
  std::abort();
}

} // namespace

const char *const CrashHandler::kRedactedSecret = "[REDACTED_SECRET_KEY]";

CrashHandler::CrashHandler(std::shared_ptr<Scanner> scanner, std::ostream &out)
    : scanner_(std::move(scanner)), out_(out) {}

void CrashHandler::report(const std::exception &error,
                          const std::vector<StackFrame> &frames) {
  writeReport(demangle(typeid(error).name()), error.what(), frames);
}

void CrashHandler::report(std::exception_ptr error,
                          const std::vector<StackFrame> &frames) {
  if (!error)
    return;
  try {
    std::rethrow_exception(error);
  } catch (const std::exception &e) {
    report(e, frames);
  } catch (...) {
    writeReport("unknown exception", "", frames);
  }
}

std::vector<std::pair<std::string, std::string>> CrashHandler::sanitizeLocals(
    const std::vector<std::pair<std::string, std::string>> &locals) {
  std::vector<std::pair<std::string, std::string>> result;
  result.reserve(locals.size());
  for (const auto &local : locals) {
    if (isSecretName(local.first)) {
      result.emplace_back(local.first, kRedactedSecret);
    } else {
      result.emplace_back(local.first, scanner_->sanitize(local.second));
    }
  }
  return result;
}

bool CrashHandler::isSecretName(const std::string &name) {
  static const char *const kMarkers[] = {"password", "senha", "secret",
                                         "key",      "token", "auth"};
  std::string lower = text::TextProcessor::toLower(name);
  for (const char *marker : kMarkers) {
    if (lower.find(marker) != std::string::npos)
      return true;
  }
  return false;
}

void CrashHandler::install(std::shared_ptr<CrashHandler> handler) {
  installedHandler() = std::move(handler);
  std::set_terminate(onTerminate);
}

void CrashHandler::writeReport(const std::string &type,
                               const std::string &message,
                               const std::vector<StackFrame> &frames) {
  out_ << "\n!!! OPAQUE CRASH HANDLER INTERCEPTED EXCEPTION !!!\n";
  out_ << "Sanitizing Traceback...\n";

  for (const auto &frame : frames) {
    out_ << "  File \"" << frame.file << "\", line " << frame.line << ", in "
         << frame.function << "\n";
    if (frame.locals.empty())
      continue;

    out_ << "    Locals: {";
    bool first = true;
    for (const auto &local : sanitizeLocals(frame.locals)) {
      if (!first)
        out_ << ", ";
      out_ << local.first << ": " << local.second;
      first = false;
    }
    out_ << "}\n";
  }

  out_ << type << ": " << scanner_->sanitize(message) << std::endl;
}

} // namespace Opaque
