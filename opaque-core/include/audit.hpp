#pragma once

#include <regex>
#include <string>
#include <vector>

namespace Opaque {
namespace audit {

struct Issue {
  int line{0}; // 1-based; 0 when the file itself could not be read
  std::string description;
};

struct FileReport {
  std::string path;
  std::vector<Issue> issues;
};

struct AuditReport {
  int totalFiles{0};
  int filesWithIssues{0};
  int score{100};
  std::vector<FileReport> files; // only files with issues
};

struct RiskyPattern {
  std::regex pattern;
  std::string description;
  std::vector<std::string> languages; // empty matches every language
};

// Static compliance scan for code that writes sensitive data to logs
class AuditScanner {
public:
  AuditScanner();

  std::vector<Issue> scanFile(const std::string &path) const;

  // Comments are blanked first so commented-out code is not reported
  std::vector<Issue> scanSource(const std::string &languageId,
                                const std::string &source) const;

  // Throws std::runtime_error when `root` is not a directory
  AuditReport scanDirectory(const std::string &root) const;

  static std::string renderHtml(const AuditReport &report);

private:
  std::vector<RiskyPattern> patterns_;
};

} // namespace audit
} // namespace Opaque
