/***
 * Name: test_print_diagnostic
 * Purpose: Validate diagnostic formatting, caret positioning and stderr output.
 */
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>
#include "compiler/Compiler.h"

using namespace spindle;

static std::string readFile(const std::string& p) {
  std::ifstream in(p);
  std::string all, line;
  while (std::getline(in, line)) { all += line; all += '\n'; }
  return all;
}

static sema::Diagnostic diagAt(const std::string& file, int line, int col, const std::string& msg) {
  sema::Diagnostic d;
  d.file = file;
  d.line = line;
  d.col = col;
  d.message = msg;
  return d;
}

TEST(PrintDiagnostic, HeaderLabelAndCaretFromSource) {
  const std::string source = "title: Start\n---\n{$nope}\n===\n";
  auto out = compiler::formatDiagnostic(diagAt("<input>", 3, 2, "oops"), false, &source);
  EXPECT_EQ(out, "<input>:3:2: error: oops\n  {$nope}\n   ^\n");
}

TEST(PrintDiagnostic, ColorAddsAnsiSequences) {
  auto d = diagAt("x.yarn", 1, 1, "careful");
  d.severity = sema::Severity::Warning;
  auto out = compiler::formatDiagnostic(d, true, nullptr);
  EXPECT_NE(out.find("\x1b[1mx.yarn:1:1: \x1b[0m"), std::string::npos);
  EXPECT_NE(out.find("\x1b[33mwarning: \x1b[0mcareful"), std::string::npos);
}

TEST(PrintDiagnostic, MissingFileNameOrLinePrintsMessageOnly) {
  EXPECT_EQ(compiler::formatDiagnostic(diagAt("", 0, 0, "general"), false), "error: general\n");
  const std::string source = "one line\n";
  EXPECT_EQ(compiler::formatDiagnostic(diagAt("f", 7, 1, "far"), false, &source), "f:7:1: error: far\n");
}

TEST(PrintDiagnostic, ReadsSourceFromDiskAndWritesToStderr) {
  const std::string srcPath = testing::TempDir() + "pd_tmp.yarn";
  { std::ofstream out(srcPath); out << "abc\nxyZ\n"; }
  const std::string outPath = testing::TempDir() + "pd_out.txt";
  int saved = dup(2);
  FILE* fp = std::fopen(outPath.c_str(), "w");
  ASSERT_NE(fp, nullptr);
  int fd = fileno(fp);
  ASSERT_GE(fd, 0);
  dup2(fd, 2);

  compiler::printDiagnostic(diagAt(srcPath, 2, 3, "bad"), /*color=*/false);

  fflush(stderr);
  dup2(saved, 2);
  close(saved);
  std::fclose(fp);

  auto out = readFile(outPath);
  EXPECT_NE(out.find("pd_tmp.yarn:2:3: error: bad"), std::string::npos);
  EXPECT_NE(out.find("\n  xyZ\n    ^\n"), std::string::npos);
}
