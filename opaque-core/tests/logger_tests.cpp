#include "logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

using namespace Opaque;
using namespace Opaque::log;

namespace {

std::shared_ptr<Scanner> maskingScanner() {
  ScannerConfig config;
  config.rules = {"BR.CPF", "FINANCE.CREDIT_CARD"};
  config.method = ObfuscationMethod::Mask;
  return std::make_shared<Scanner>(config);
}

} // namespace

TEST(LoggerTests, WritesSanitizedLines) {
  std::ostringstream sink;
  Logger logger("app", maskingScanner(), sink);
  logger.info("payment by 529.982.247-25 with 4111 1111 1111 1111");
  EXPECT_EQ(sink.str(), "INFO:app:payment by *** with ***\n");
}

TEST(LoggerTests, LevelFiltering) {
  std::ostringstream sink;
  Logger logger("app", maskingScanner(), sink);
  logger.setLevel(Level::Warning);
  logger.debug("hidden");
  logger.info("hidden");
  logger.warning("shown");
  logger.critical("also shown");
  EXPECT_EQ(sink.str(), "WARNING:app:shown\nCRITICAL:app:also shown\n");
  EXPECT_TRUE(logger.isEnabledFor(Level::Error));
  EXPECT_FALSE(logger.isEnabledFor(Level::Info));
}

TEST(LoggerTests, StructuredMessagesAreDumpedAfterSanitizing) {
  std::ostringstream sink;
  Logger logger("api", maskingScanner(), sink);
  logger.logStructure(Level::Info, json{{"cpf", "529.982.247-25"}});
  EXPECT_EQ(sink.str(), "INFO:api:{\n  \"cpf\": \"***\"\n}\n");

  sink.str("");
  logger.logStructure(Level::Error, json("529.982.247-25"));
  EXPECT_EQ(sink.str(), "ERROR:api:***\n");
}

TEST(LoggerTests, SecurityChannelBypassesScanner) {
  std::ostringstream sink;
  Logger security(Logger::kSecurityChannel, sink);
  EXPECT_EQ(security.scanner(), nullptr);
  security.warning("raw 529.982.247-25");
  EXPECT_EQ(sink.str(), "WARNING:opaque.security:raw 529.982.247-25\n");
}

TEST(LoggerTests, SetupDefaultsChangesScannerForNewLoggers) {
  ScannerConfig config;
  config.rules = {"BR.CPF"};
  config.method = ObfuscationMethod::Mask;
  Logger::setupDefaults(config);

  std::ostringstream sink;
  Logger logger("defaults", sink);
  EXPECT_EQ(logger.scanner(), Logger::defaultScanner());
  logger.error("cpf 529.982.247-25");
  EXPECT_EQ(sink.str(), "ERROR:defaults:cpf ***\n");

  Logger::setupDefaults(ScannerConfig{});
  std::ostringstream plain;
  Logger untouched("plain", plain);
  untouched.info("cpf 529.982.247-25");
  EXPECT_EQ(plain.str(), "INFO:plain:cpf 529.982.247-25\n");
}

TEST(LoggerTests, SinkCanBeRedirected) {
  std::ostringstream first;
  std::ostringstream second;
  Logger logger("app", nullptr, first);
  logger.info("one");
  logger.setSink(second);
  logger.info("two");
  EXPECT_EQ(first.str(), "INFO:app:one\n");
  EXPECT_EQ(second.str(), "INFO:app:two\n");
}

TEST(LogLevelTests, ParseAndName) {
  EXPECT_EQ(parseLevel("debug"), Level::Debug);
  EXPECT_EQ(parseLevel("INFO"), Level::Info);
  EXPECT_EQ(parseLevel("Warn"), Level::Warning);
  EXPECT_EQ(parseLevel("WARNING"), Level::Warning);
  EXPECT_EQ(parseLevel("critical"), Level::Critical);
  EXPECT_THROW(parseLevel("verbose"), ConfigError);
  EXPECT_STREQ(levelName(Level::Error), "ERROR");
}
