#include "audit.hpp"
#include "comment_extractor.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

namespace fs = std::filesystem;
using namespace Opaque;

namespace {

void writeFile(const fs::path &path, const std::string &content) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

class AuditDirectoryTests : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::path(::testing::TempDir()) /
            ("opaque_audit_" + std::to_string(::getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_);
  }
  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
};

} // namespace

TEST(CommentExtractorTests, LanguageForPath) {
  EXPECT_EQ(comments::languageForPath("src/app.py"), "python");
  EXPECT_EQ(comments::languageForPath("include/x.HPP"), "cpp");
  EXPECT_EQ(comments::languageForPath("web/index.tsx"), "tsx");
  EXPECT_EQ(comments::languageForPath("lib.rs"), "rust");
  EXPECT_EQ(comments::languageForPath("Makefile"), "");
  EXPECT_EQ(comments::languageForPath("dir.v1/README"), "");
  EXPECT_TRUE(comments::isLanguageSupported("Python"));
  EXPECT_FALSE(comments::isLanguageSupported("cobol"));
}

TEST(CommentExtractorTests, ExtractsCommentsInSourceOrder) {
  std::string source = "int a; // first\n/* second */ int b;\n";
  auto segments = comments::extractComments("cpp", source);
  ASSERT_EQ(segments.size(), 2u);
  EXPECT_EQ(segments[0].text, "// first");
  EXPECT_EQ(segments[0].startByte, 7u);
  EXPECT_EQ(segments[1].text, "/* second */");
  EXPECT_TRUE(comments::extractComments("cobol", source).empty());
}

TEST(CommentExtractorTests, MaskKeepsLayout) {
  std::string source = "x = 1  # secret\ny = 2\n";
  std::string masked = comments::maskComments("python", source);
  EXPECT_EQ(masked.size(), source.size());
  EXPECT_EQ(masked, "x = 1          \ny = 2\n");
  // Unsupported languages come back untouched
  EXPECT_EQ(comments::maskComments("cobol", source), source);
}

TEST(AuditScannerTests, PythonPatterns) {
  audit::AuditScanner scanner;
  auto issues = scanner.scanSource(
      "python", "import pdb\n"
                "# print('commented out')\n"
                "print('hello')\n"
                "logging.info(f'user {user}')\n"
                "fingerprint(x)\n"
                "pdb.set_trace()\n");
  ASSERT_EQ(issues.size(), 3u);
  EXPECT_EQ(issues[0].line, 3);
  EXPECT_EQ(issues[0].description, "Use of print() instead of logging");
  EXPECT_EQ(issues[1].line, 4);
  EXPECT_EQ(issues[1].description, "Logging user object directly");
  EXPECT_EQ(issues[2].line, 6);
  EXPECT_EQ(issues[2].description, "Debugger breakpoint left in code");
}

TEST(AuditScannerTests, OtherLanguages) {
  audit::AuditScanner scanner;

  auto js = scanner.scanSource("javascript",
                               "// console.log(a)\nconsole.log(b);\ndebugger;\n");
  ASSERT_EQ(js.size(), 2u);
  EXPECT_EQ(js[0].line, 2);
  EXPECT_EQ(js[1].description, "Debugger statement left in code");

  auto cpp = scanner.scanSource(
      "cpp", "/* printf(\"x\") */\nint main() { std::cout << 1; }\n");
  ASSERT_EQ(cpp.size(), 1u);
  EXPECT_EQ(cpp[0].line, 2);
  EXPECT_EQ(cpp[0].description, "Use of std::cout instead of logging");

  auto rust = scanner.scanSource("rust", "fn main() { dbg!(x); }\n");
  ASSERT_EQ(rust.size(), 1u);
  EXPECT_EQ(rust[0].description, "Debug macro left in code");

  // Python rules do not apply to other languages
  EXPECT_TRUE(scanner.scanSource("rust", "let s = \"x\"; // pdb.set_trace\n")
                  .empty());
}

TEST_F(AuditDirectoryTests, ScoresAndRendersReport) {
  writeFile(root_ / "clean.py", "import logging\nlogging.warning('ok')\n");
  writeFile(root_ / "bad.py", "print('debug <b>')\n");
  writeFile(root_ / "notes.txt", "print('ignored')\n");
  writeFile(root_ / "sub" / "lib.rs", "fn f() {}\n");

  audit::AuditScanner scanner;
  audit::AuditReport report = scanner.scanDirectory(root_.string());
  EXPECT_EQ(report.totalFiles, 3);
  EXPECT_EQ(report.filesWithIssues, 1);
  EXPECT_EQ(report.score, 66);
  ASSERT_EQ(report.files.size(), 1u);
  EXPECT_EQ(fs::path(report.files[0].path).filename().string(), "bad.py");

  std::string html = audit::AuditScanner::renderHtml(report);
  EXPECT_NE(html.find("<title>OPAQUE Compliance Report</title>"),
            std::string::npos);
  EXPECT_NE(html.find("Security Score: <span class='issue'>66%</span>"),
            std::string::npos);
  EXPECT_NE(html.find("<p>Scanned 3 files. Found issues in 1 files.</p>"),
            std::string::npos);
  EXPECT_NE(html.find("<li class='issue'>Line 1: Use of print() instead of "
                      "logging</li>"),
            std::string::npos);
}

TEST_F(AuditDirectoryTests, EmptyDirectoryScoresFull) {
  audit::AuditScanner scanner;
  audit::AuditReport report = scanner.scanDirectory(root_.string());
  EXPECT_EQ(report.totalFiles, 0);
  EXPECT_EQ(report.score, 100);
  EXPECT_NE(audit::AuditScanner::renderHtml(report).find(
                "<span class='safe'>100%</span>"),
            std::string::npos);
}

TEST_F(AuditDirectoryTests, UnreadableFilesAreReported) {
  writeFile(root_ / "latin1.py", "x = 'S\xe3o Paulo'\n");
  audit::AuditScanner scanner;
  auto issues = scanner.scanFile((root_ / "latin1.py").string());
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].line, 0);
  EXPECT_EQ(issues[0].description.rfind("Could not scan file:", 0), 0u);

  issues = scanner.scanFile((root_ / "missing.py").string());
  ASSERT_EQ(issues.size(), 1u);
  EXPECT_EQ(issues[0].line, 0);
}

TEST_F(AuditDirectoryTests, RootMustBeADirectory) {
  audit::AuditScanner scanner;
  EXPECT_THROW(scanner.scanDirectory((root_ / "nope").string()),
               std::runtime_error);
}
