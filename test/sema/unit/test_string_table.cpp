/***
 * Name: test_string_table
 * Purpose: Verify line id assignment, metadata and duplicate-id diagnostics.
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "compiler/Compiler.h"

using namespace spindle;

static compiler::CompilationResult stringsOf(const char* src) {
  auto job = compiler::CompilationJob::fromSource(src);
  job.compilationType = compiler::CompilationType::StringsOnly;
  return compiler::compile(job);
}

TEST(StringTable, ImplicitAndExplicitIds) {
  auto r = stringsOf(
      "title: Start\n"
      "---\n"
      "First.\n"
      "Second. #line:second #mood:happy\n"
      "Third {$x}.\n"
      "===\n");
  EXPECT_TRUE(r.diagnostics.empty());
  EXPECT_FALSE(r.program.has_value());
  EXPECT_TRUE(r.containsImplicitStringTags);
  ASSERT_EQ(r.stringTable.size(), 3u);

  const auto& first = r.stringTable.at("line:<input>-Start-0");
  EXPECT_EQ(first.text, "First.");
  EXPECT_EQ(first.nodeName, "Start");
  EXPECT_EQ(first.lineNumber, 3);
  EXPECT_EQ(first.fileName, "<input>");
  EXPECT_TRUE(first.isImplicitTag);

  const auto& second = r.stringTable.at("line:second");
  EXPECT_FALSE(second.isImplicitTag);
  EXPECT_EQ(second.metadata, (std::vector<std::string>{"mood:happy"}));

  EXPECT_EQ(r.stringTable.at("line:<input>-Start-1").text, "Third {0}.");
}

TEST(StringTable, OnlyExplicitIdsMeansNoImplicitTags) {
  auto r = stringsOf("title: A\n---\nHi. #line:hi\n===\n");
  EXPECT_FALSE(r.containsImplicitStringTags);
  EXPECT_EQ(r.stringTable.count("line:hi"), 1u);
}

TEST(StringTable, LastLineBeforeOptionsIsTagged) {
  auto r = stringsOf(
      "title: A\n"
      "---\n"
      "Intro.\n"
      "Question? #line:q\n"
      "-> Yes #line:yes\n"
      "    Answer. #line:answer\n"
      "    Follow up? #line:follow\n"
      "    -> Sure #line:sure\n"
      "===\n");
  ASSERT_TRUE(r.diagnostics.empty());
  EXPECT_EQ(r.stringTable.at("line:q").metadata, (std::vector<std::string>{"lastline"}));
  EXPECT_EQ(r.stringTable.at("line:follow").metadata, (std::vector<std::string>{"lastline"}));
  EXPECT_TRUE(r.stringTable.at("line:answer").metadata.empty());
  EXPECT_TRUE(r.stringTable.at("line:yes").metadata.empty());
}

TEST(StringTable, DuplicateExplicitIdIsError) {
  auto r = stringsOf(
      "title: A\n"
      "---\n"
      "One. #line:same\n"
      "Two. #line:same\n"
      "===\n");
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_EQ(r.diagnostics[0].severity, sema::Severity::Error);
  EXPECT_EQ(r.diagnostics[0].line, 4);
  EXPECT_EQ(r.stringTable.at("line:same").text, "One.");
}

TEST(StringTable, EmptyExplicitIdIsError) {
  auto r = stringsOf(
      "title: A\n"
      "---\n"
      "One. #line:\n"
      "===\n");
  ASSERT_EQ(r.diagnostics.size(), 1u);
  EXPECT_EQ(r.diagnostics[0].severity, sema::Severity::Error);
  EXPECT_EQ(r.diagnostics[0].line, 3);
  EXPECT_NE(r.diagnostics[0].message.find("is empty"), std::string::npos);
  EXPECT_EQ(r.stringTable.count("line:"), 0u);
  EXPECT_EQ(r.stringTable.at("line:<input>-A-0").text, "One.");
}

TEST(StringTable, RawTextNodeStoresItsSource) {
  auto r = stringsOf(
      "title: Notes\n"
      "tags: rawText\n"
      "---\n"
      "Anything {goes} here\n"
      "===\n");
  EXPECT_TRUE(r.diagnostics.empty());
  ASSERT_EQ(r.stringTable.count("line:Notes"), 1u);
  EXPECT_EQ(r.stringTable.at("line:Notes").text, "Anything {goes} here");
  EXPECT_TRUE(r.stringTable.at("line:Notes").isImplicitTag);
}

TEST(StringTable, ImplicitIdsAreStableAcrossCompilations) {
  const char* src = "title: A\n---\nOne.\n-> Two\n-> Three\n===\n";
  auto a = compiler::compile(compiler::CompilationJob::fromSource(src));
  auto b = compiler::compile(compiler::CompilationJob::fromSource(src));
  EXPECT_EQ(a.stringTable, b.stringTable);
  EXPECT_EQ(a.program, b.program);
  EXPECT_EQ(a.diagnostics, b.diagnostics);
}
