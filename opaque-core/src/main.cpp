#include "audit.hpp"
#include "config.hpp"
#include "crash_handler.hpp"
#include "encoding_utils.hpp"
#include "logger.hpp"
#include "rpc_server.hpp"
#include "scanner.hpp"
#include "text_processor.hpp"
#include "vault.hpp"

#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <getopt.h>

#ifndef OPAQUE_VERSION
#define OPAQUE_VERSION "0.0.0"
#endif

namespace {

void printUsage(std::ostream &out) {
  out << "usage: opaque <command> [options]\n"
         "\n"
         "commands:\n"
         "  reveal TOKEN --key KEY     decrypt a [VAULT:...] token\n"
         "  scan [DIR] [--output FILE] write an HTML compliance report\n"
         "  sanitize [options]         sanitize stdin to stdout\n"
         "      --config FILE          JSON configuration\n"
         "      --rules ID,...         rules to enable (e.g. BR.CPF)\n"
         "      --method M             HASH, MASK, VAULT or ANONYMIZE\n"
         "      --encoding CHARSET     input charset (default UTF-8)\n"
         "      --json                 treat stdin as one JSON document\n"
         "  serve [--config FILE]      JSON-RPC server on stdin/stdout\n"
         "\n"
         "  -h, --help                 show this help\n"
         "  -V, --version              show version\n";
}

// Longer than the webhook's own request timeout
const std::chrono::milliseconds kAlertFlushTimeout(6000);

std::vector<std::string> splitList(const std::string &value) {
  std::vector<std::string> items;
  std::stringstream stream(value);
  std::string item;
  while (std::getline(stream, item, ',')) {
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

std::string readAll(std::istream &in) {
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

// getopt_long over argv[1..], so argv[1] (the command) plays argv[0]
struct CommandArgs {
  std::string config;
  std::string key;
  std::string output;
  std::string rules;
  std::string method;
  std::string encoding;
  bool json{false};
  std::vector<std::string> operands;
};

bool parseCommandArgs(int argc, char **argv, CommandArgs &args) {
  static const struct option longOptions[] = {
      {"config", required_argument, nullptr, 'c'},
      {"key", required_argument, nullptr, 'k'},
      {"output", required_argument, nullptr, 'o'},
      {"rules", required_argument, nullptr, 'r'},
      {"method", required_argument, nullptr, 'm'},
      {"encoding", required_argument, nullptr, 'e'},
      {"json", no_argument, nullptr, 'j'},
      {nullptr, 0, nullptr, 0}};

  optind = 1;
  int opt;
  while ((opt = getopt_long(argc, argv, "c:k:o:r:m:e:j", longOptions,
                            nullptr)) != -1) {
    switch (opt) {
    case 'c':
      args.config = optarg;
      break;
    case 'k':
      args.key = optarg;
      break;
    case 'o':
      args.output = optarg;
      break;
    case 'r':
      args.rules = optarg;
      break;
    case 'm':
      args.method = optarg;
      break;
    case 'e':
      args.encoding = optarg;
      break;
    case 'j':
      args.json = true;
      break;
    default:
      return false;
    }
  }
  for (int i = optind; i < argc; ++i) {
    args.operands.push_back(argv[i]);
  }
  return true;
}

Opaque::OpaqueConfig loadConfig(const CommandArgs &args) {
  Opaque::OpaqueConfig config;
  if (!args.config.empty()) {
    config = Opaque::loadConfigFile(args.config);
  }
  if (!args.rules.empty()) {
    config.scanner.rules = splitList(args.rules);
  }
  if (!args.method.empty()) {
    config.scanner.method = Opaque::parseObfuscationMethod(args.method);
  }
  Opaque::applyEnvironment(config);
  Opaque::log::securityLogger().setLevel(
      Opaque::log::parseLevel(config.log.level));
  return config;
}

int runReveal(const CommandArgs &args) {
  if (args.operands.size() != 1 || args.key.empty()) {
    std::cerr << "usage: opaque reveal TOKEN --key KEY" << std::endl;
    return 2;
  }
  try {
    Opaque::Vault vault(args.key);
    std::cout << "REVEALED DATA: " << vault.decrypt(args.operands[0])
              << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}

int runScan(const CommandArgs &args) {
  if (args.operands.size() > 1) {
    std::cerr << "usage: opaque scan [DIR] [--output FILE]" << std::endl;
    return 2;
  }
  Opaque::OpaqueConfig config = loadConfig(args);
  std::string directory = args.operands.empty() ? "." : args.operands[0];
  std::string output = args.output.empty() ? config.audit.output : args.output;

  std::cout << "Scanning directory: " << directory << "..." << std::endl;
  Opaque::audit::AuditScanner scanner;
  Opaque::audit::AuditReport report = scanner.scanDirectory(directory);

  std::ofstream file(output, std::ios::binary);
  if (!file) {
    std::cerr << "Error: cannot write " << output << std::endl;
    return 1;
  }
  file << Opaque::audit::AuditScanner::renderHtml(report);
  file.close();

  std::cout << "Report generated: " << output << std::endl;
  std::cout << "Security Score: " << report.score << "%" << std::endl;
  return 0;
}

int runSanitize(const CommandArgs &args) {
  Opaque::OpaqueConfig config = loadConfig(args);
  auto scanner = std::make_shared<Opaque::Scanner>(config.scanner);
  Opaque::CrashHandler::install(
      std::make_shared<Opaque::CrashHandler>(scanner));

  if (args.json) {
    std::string input = Opaque::encoding::toUtf8(readAll(std::cin),
                                                 args.encoding);
    Opaque::json document = Opaque::json::parse(input);
    std::cout << scanner->processStructure(document).dump(2) << std::endl;
  } else if (!args.encoding.empty()) {
    std::string input = Opaque::encoding::toUtf8(readAll(std::cin),
                                                 args.encoding);
    for (const auto &line : Opaque::text::TextProcessor::splitLines(input)) {
      std::cout << scanner->sanitize(line) << '\n';
    }
  } else {
    std::string line;
    while (std::getline(std::cin, line)) {
      if (!line.empty() && line.back() == '\r')
        line.pop_back();
      std::cout << scanner->sanitize(line) << '\n';
    }
  }
  std::cout.flush();

  // Webhook alerts run on detached threads; let them finish before exit
  scanner->flushAlerts(kAlertFlushTimeout);
  return 0;
}

int runServe(const CommandArgs &args) {
  Opaque::OpaqueConfig config = loadConfig(args);
  Opaque::RpcServer server(std::cin, std::cout, config);
  server.run();
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    printUsage(std::cerr);
    return 2;
  }

  std::string command = argv[1];
  if (command == "-h" || command == "--help" || command == "help") {
    printUsage(std::cout);
    return 0;
  }
  if (command == "-V" || command == "--version") {
    std::cout << "opaque " << OPAQUE_VERSION << std::endl;
    return 0;
  }

  CommandArgs args;
  if (!parseCommandArgs(argc - 1, argv + 1, args)) {
    printUsage(std::cerr);
    return 2;
  }

  try {
    if (command == "reveal")
      return runReveal(args);
    if (command == "scan")
      return runScan(args);
    if (command == "sanitize")
      return runSanitize(args);
    if (command == "serve")
      return runServe(args);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << "unknown command: " << command << std::endl;
  printUsage(std::cerr);
  return 2;
}
