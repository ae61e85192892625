/***
 * Name: test_diagnostics_dedup
 * Purpose: Verify identical diagnostics are reported once and in a stable order.
 */
#include <gtest/gtest.h>
#include <vector>
#include "compiler/Compiler.h"
#include "sema/detail/Helpers.h"

using namespace spindle;

TEST(DiagnosticsDedup, SortsAndCollapsesDuplicates) {
  std::vector<sema::Diagnostic> diags;
  sema::addDiag(diags, sema::Severity::Warning, "w", "b.yarn", 2, 1);
  sema::addDiag(diags, sema::Severity::Error, "e", "a.yarn", 9, 1);
  sema::addDiag(diags, sema::Severity::Warning, "w", "b.yarn", 2, 1);
  sema::addDiag(diags, sema::Severity::Error, "e", "a.yarn", 3, 4);
  sema::dedupDiagnostics(diags);
  ASSERT_EQ(diags.size(), 3u);
  EXPECT_EQ(diags[0].line, 3);
  EXPECT_EQ(diags[1].line, 9);
  EXPECT_EQ(diags[2].file, "b.yarn");
  EXPECT_TRUE(sema::hasErrors(diags));
}

TEST(DiagnosticsDedup, HasErrorsIgnoresWarnings) {
  std::vector<sema::Diagnostic> diags;
  sema::addDiag(diags, sema::Severity::Warning, "only a warning", "a.yarn", 1, 1);
  EXPECT_FALSE(sema::hasErrors(diags));
}

TEST(DiagnosticsDedup, IdenticalFilesReportOnce) {
  compiler::CompilationJob job;
  job.addFile("same.yarn", "title: A\n---\n{$nope}\n===\n");
  job.addFile("same.yarn", "title: A\n---\n{$nope}\n===\n");
  auto r = compiler::compile(job);
  std::size_t unknown = 0;
  for (const auto& d : r.diagnostics) {
    if (d.message.find("$nope") != std::string::npos) { ++unknown; }
  }
  EXPECT_EQ(unknown, 1u);
  EXPECT_FALSE(r.program.has_value());
}
