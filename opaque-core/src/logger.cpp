#include "logger.hpp"
#include "text_processor.hpp"

namespace Opaque {
namespace log {

namespace {

std::mutex &defaultsMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<Scanner> &defaultScannerSlot() {
  static std::shared_ptr<Scanner> scanner =
      std::make_shared<Scanner>(ScannerConfig{});
  return scanner;
}

} // namespace

const char *const Logger::kSecurityChannel = "opaque.security";

Level parseLevel(const std::string &name) {
  std::string lower = text::TextProcessor::toLower(name);
  if (lower == "debug")
    return Level::Debug;
  if (lower == "info")
    return Level::Info;
  if (lower == "warning" || lower == "warn")
    return Level::Warning;
  if (lower == "error")
    return Level::Error;
  if (lower == "critical")
    return Level::Critical;
  throw ConfigError("unknown log level: " + name);
}

const char *levelName(Level level) {
  switch (level) {
  case Level::Debug:
    return "DEBUG";
  case Level::Info:
    return "INFO";
  case Level::Warning:
    return "WARNING";
  case Level::Error:
    return "ERROR";
  case Level::Critical:
    return "CRITICAL";
  }
  return "UNKNOWN";
}

Logger::Logger(const std::string &name, std::ostream &sink)
    : Logger(name, name == kSecurityChannel ? nullptr : defaultScanner(),
             sink) {}

Logger::Logger(const std::string &name, std::shared_ptr<Scanner> scanner,
               std::ostream &sink)
    : name_(name), scanner_(std::move(scanner)), sink_(&sink) {}

void Logger::setupDefaults(const ScannerConfig &config, Callbacks callbacks) {
  auto scanner = std::make_shared<Scanner>(config, std::move(callbacks));
  std::lock_guard<std::mutex> lock(defaultsMutex());
  defaultScannerSlot() = std::move(scanner);
}

std::shared_ptr<Scanner> Logger::defaultScanner() {
  std::lock_guard<std::mutex> lock(defaultsMutex());
  return defaultScannerSlot();
}

bool Logger::isEnabledFor(Level level) const {
  return static_cast<int>(level) >= static_cast<int>(level_);
}

void Logger::log(Level level, const std::string &message) {
  if (!isEnabledFor(level))
    return;
  write(level, scanner_ ? scanner_->sanitize(message) : message);
}

void Logger::logStructure(Level level, const json &message) {
  if (!isEnabledFor(level))
    return;
  if (message.is_string()) {
    log(level, message.get<std::string>());
    return;
  }
  json clean = scanner_ ? scanner_->processStructure(message) : message;
  write(level, clean.dump(2));
}

void Logger::setSink(std::ostream &sink) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  sink_ = &sink;
}

void Logger::write(Level level, const std::string &message) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  *sink_ << levelName(level) << ':' << name_ << ':' << message << std::endl;
}

Logger &securityLogger() {
  static Logger logger(Logger::kSecurityChannel, nullptr, std::cerr);
  return logger;
}

} // namespace log
} // namespace Opaque
