#include "audit.hpp"
#include "comment_extractor.hpp"
#include "text_processor.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace Opaque {
namespace audit {

namespace {

bool isDebugEnabled() {
  static bool initialized = false;
  static bool debug = false;
  if (!initialized) {
    debug = (std::getenv("OPAQUE_DEBUG") != nullptr);
    initialized = true;
  }
  return debug;
}

bool appliesTo(const RiskyPattern &pattern, const std::string &languageId) {
  if (pattern.languages.empty())
    return true;
  return std::find(pattern.languages.begin(), pattern.languages.end(),
                   languageId) != pattern.languages.end();
}

std::string escapeHtml(const std::string &input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    case '\'':
      out += "&#39;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

} // namespace

AuditScanner::AuditScanner() {
  const std::vector<std::string> python = {"python"};
  const std::vector<std::string> script = {"javascript", "javascriptreact",
                                           "typescript", "tsx"};
  const std::vector<std::string> native = {"c", "cpp"};
  const std::vector<std::string> rust = {"rust"};

  patterns_ = {
      {std::regex(R"(\bprint\()"), "Use of print() instead of logging",
       python},
      {std::regex(R"(logging\.info\(.*user.*\))"),
       "Logging user object directly", python},
      {std::regex(R"(logging\.info\(.*email.*\))"), "Logging email directly",
       python},
      {std::regex(R"(logging\.info\(.*cpf.*\))"), "Logging CPF directly",
       python},
      {std::regex(R"(pdb\.set_trace)"), "Debugger breakpoint left in code",
       python},
      {std::regex(R"(console\.log\()"),
       "Use of console.log() instead of logging", script},
      {std::regex(R"(\bdebugger\b)"), "Debugger statement left in code",
       script},
      {std::regex(R"(\bprintf\()"), "Use of printf() instead of logging",
       native},
      {std::regex(R"(std::cout)"), "Use of std::cout instead of logging",
       native},
      {std::regex(R"(\bprintln!\()"), "Use of println!() instead of logging",
       rust},
      {std::regex(R"(\bdbg!\()"), "Debug macro left in code", rust},
  };
}

std::vector<Issue> AuditScanner::scanFile(const std::string &path) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return {{0, "Could not scan file: cannot open " + path}};
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  std::string source = buffer.str();

  if (!text::TextProcessor::isValidUTF8(source)) {
    return {{0, "Could not scan file: invalid UTF-8"}};
  }
  return scanSource(comments::languageForPath(path), source);
}

std::vector<Issue>
AuditScanner::scanSource(const std::string &languageId,
                         const std::string &source) const {
  std::vector<Issue> issues;
  std::string code = comments::maskComments(languageId, source);
  std::vector<std::string> lines = text::TextProcessor::splitLines(code);

  for (size_t i = 0; i < lines.size(); ++i) {
    for (const auto &risky : patterns_) {
      if (appliesTo(risky, languageId) &&
          std::regex_search(lines[i], risky.pattern)) {
        issues.push_back({static_cast<int>(i + 1), risky.description});
      }
    }
  }
  return issues;
}

AuditReport AuditScanner::scanDirectory(const std::string &root) const {
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw std::runtime_error("not a directory: " + root);
  }

  std::vector<std::string> paths;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file(ec))
      continue;
    std::string path = it->path().string();
    if (!comments::languageForPath(path).empty()) {
      paths.push_back(path);
    }
  }
  if (ec && isDebugEnabled()) {
    std::cerr << "[DEBUG] directory walk stopped early: " << ec.message()
              << std::endl;
  }
  std::sort(paths.begin(), paths.end());

  AuditReport report;
  for (const auto &path : paths) {
    ++report.totalFiles;
    std::vector<Issue> issues = scanFile(path);
    if (!issues.empty()) {
      ++report.filesWithIssues;
      report.files.push_back({path, std::move(issues)});
    }
  }

  if (report.totalFiles > 0) {
    report.score = (report.totalFiles - report.filesWithIssues) * 100 /
                   report.totalFiles;
  }
  return report;
}

std::string AuditScanner::renderHtml(const AuditReport &report) {
  std::ostringstream html;
  html << "<html><head><title>OPAQUE Compliance Report</title>"
       << "<style>body{font-family:sans-serif; padding:20px;} "
          ".issue{color:red;} .safe{color:green;}</style></head><body>"
       << "<h1>OPAQUE Compliance Report</h1>";

  html << "<h2>Security Score: <span class='"
       << (report.score > 90 ? "safe" : "issue") << "'>" << report.score
       << "%</span></h2>";
  html << "<p>Scanned " << report.totalFiles << " files. Found issues in "
       << report.filesWithIssues << " files.</p>";

  for (const auto &file : report.files) {
    html << "<h3>" << escapeHtml(file.path) << "</h3><ul>";
    for (const auto &issue : file.issues) {
      html << "<li class='issue'>Line " << issue.line << ": "
           << escapeHtml(issue.description) << "</li>";
    }
    html << "</ul>";
  }

  html << "</body></html>";
  return html.str();
}

} // namespace audit
} // namespace Opaque
