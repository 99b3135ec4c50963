#pragma once

#include "scanner.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace Opaque {

struct StackFrame {
  std::string file;
  int line{0};
  std::string function;
  std::vector<std::pair<std::string, std::string>> locals;
};

// Prints a sanitized report for an uncaught exception. Frame locals whose
// name looks like a secret are replaced outright; every other value and the
// exception message go through the scanner.
class CrashHandler {
public:
  static const char *const kRedactedSecret;

  explicit CrashHandler(std::shared_ptr<Scanner> scanner,
                        std::ostream &out = std::cerr);

  void report(const std::exception &error,
              const std::vector<StackFrame> &frames = {});
  void report(std::exception_ptr error,
              const std::vector<StackFrame> &frames = {});

  std::vector<std::pair<std::string, std::string>>
  sanitizeLocals(const std::vector<std::pair<std::string, std::string>> &locals);

  // password, senha, secret, key, token, auth (case-insensitive substring)
  static bool isSecretName(const std::string &name);

  // Routes std::terminate through this handler. The handler must outlive
  // the process; install() keeps a shared reference to it.
  static void install(std::shared_ptr<CrashHandler> handler);

private:
  void writeReport(const std::string &type, const std::string &message,
                   const std::vector<StackFrame> &frames);

  std::shared_ptr<Scanner> scanner_;
  std::ostream &out_;
};

} // namespace Opaque
