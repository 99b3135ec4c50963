#pragma once

#include "scanner.hpp"

#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace Opaque {
namespace log {

enum class Level { Debug = 10, Info = 20, Warning = 30, Error = 40, Critical = 50 };

// "DEBUG", "info", "WARN", ... Throws ConfigError for anything else.
Level parseLevel(const std::string &name);

const char *levelName(Level level);

// Named logger that runs every message through a Scanner before writing
// "LEVEL:name:message" lines to its sink. The security channel writes
// unfiltered so it never recurses into the scanner that feeds it.
class Logger {
public:
  static const char *const kSecurityChannel;

  // Uses the process-wide scanner installed by setupDefaults()
  explicit Logger(const std::string &name, std::ostream &sink = std::cerr);
  Logger(const std::string &name, std::shared_ptr<Scanner> scanner,
         std::ostream &sink = std::cerr);

  // Replaces the scanner new loggers pick up by default
  static void setupDefaults(const ScannerConfig &config,
                            Callbacks callbacks = {});
  static std::shared_ptr<Scanner> defaultScanner();

  void log(Level level, const std::string &message);

  // Objects and arrays are sanitized value by value, then dumped with an
  // indent of 2
  void logStructure(Level level, const json &message);

  void debug(const std::string &message) { log(Level::Debug, message); }
  void info(const std::string &message) { log(Level::Info, message); }
  void warning(const std::string &message) { log(Level::Warning, message); }
  void error(const std::string &message) { log(Level::Error, message); }
  void critical(const std::string &message) { log(Level::Critical, message); }

  void setLevel(Level level) { level_ = level; }
  Level level() const { return level_; }
  bool isEnabledFor(Level level) const;

  void setSink(std::ostream &sink);

  const std::string &name() const { return name_; }
  std::shared_ptr<Scanner> scanner() const { return scanner_; }

private:
  void write(Level level, const std::string &message);

  std::string name_;
  std::shared_ptr<Scanner> scanner_;
  std::ostream *sink_;
  Level level_{Level::Info};
  std::mutex write_mutex_;
};

// Channel for the scanner's own warnings (failed validations)
Logger &securityLogger();

} // namespace log
} // namespace Opaque
