/***
 * Name: test_parser_statements
 * Purpose: Verify body statements: lines, options, set/declare, if, jump, stop, commands.
 */
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "ast/Nodes.h"
#include "lexer/SourceText.h"
#include "parser/Parser.h"

using namespace spindle;

struct Parsed {
  std::unique_ptr<ast::File> file;
  std::vector<sema::Diagnostic> diags;
};

static Parsed parseBody(const std::string& body) {
  lex::SourceText input("title: Start\n---\n" + body + "===\n", "body.yarn");
  parse::Parser P(input);
  Parsed out;
  out.file = P.parseFile();
  out.diags = P.diagnostics();
  return out;
}

template <typename T>
static const T& stmtAt(const Parsed& p, std::size_t i) {
  return static_cast<const T&>(*p.file->nodes.at(0)->body.at(i));
}

TEST(ParserStatements, LineWithInterpolationAndTags) {
  auto p = parseBody("Guard: You have {$gold + 1} coins \\{not\\} #line:abc #mood\n");
  ASSERT_TRUE(p.diags.empty());
  const auto& line = stmtAt<ast::LineStmt>(p, 0);
  EXPECT_EQ(line.text.text, "Guard: You have {0} coins {not}");
  ASSERT_EQ(line.text.substitutions.size(), 1u);
  EXPECT_EQ(line.text.substitutions[0]->kind, ast::NodeKind::BinaryExpr);
  EXPECT_EQ(line.hashtags, (std::vector<std::string>{"line:abc", "mood"}));
  EXPECT_EQ(line.line, 3);
}

TEST(ParserStatements, OptionGroupWithBodiesAndConditions) {
  auto p = parseBody(
      "What now?\n"
      "-> Fight <<if $brave>> #line:fight\n"
      "    You swing.\n"
      "    <<set $hp to $hp - 1>>\n"
      "-> Flee\n"
      "After.\n");
  ASSERT_TRUE(p.diags.empty());
  ASSERT_EQ(p.file->nodes[0]->body.size(), 3u);
  const auto& group = stmtAt<ast::OptionGroup>(p, 1);
  ASSERT_EQ(group.options.size(), 2u);
  const auto& fight = *group.options[0];
  EXPECT_EQ(fight.text.text, "Fight");
  ASSERT_NE(fight.condition, nullptr);
  EXPECT_EQ(fight.condition->kind, ast::NodeKind::VariableRef);
  EXPECT_EQ(fight.hashtags, (std::vector<std::string>{"line:fight"}));
  ASSERT_EQ(fight.body.size(), 2u);
  EXPECT_EQ(fight.body[1]->kind, ast::NodeKind::SetStmt);
  EXPECT_EQ(group.options[1]->condition, nullptr);
  EXPECT_TRUE(group.options[1]->body.empty());
  EXPECT_EQ(stmtAt<ast::LineStmt>(p, 2).text.text, "After.");
}

TEST(ParserStatements, SetAndDeclareForms) {
  auto p = parseBody(
      "<<set $a to 1>>\n"
      "<<set $b = \"x\">>\n"
      "<<declare $c = true>>\n"
      "<<declare $d = 2 as Number>>\n"
      "<<declare $e as String>>\n");
  ASSERT_TRUE(p.diags.empty());
  EXPECT_EQ(stmtAt<ast::SetStmt>(p, 0).variable, "$a");
  EXPECT_EQ(stmtAt<ast::SetStmt>(p, 1).value->kind, ast::NodeKind::StringLiteral);
  const auto& c = stmtAt<ast::DeclareStmt>(p, 2);
  EXPECT_EQ(c.variable, "$c");
  EXPECT_FALSE(c.typeName.has_value());
  const auto& d = stmtAt<ast::DeclareStmt>(p, 3);
  EXPECT_EQ(d.typeName, std::optional<std::string>("Number"));
  const auto& e = stmtAt<ast::DeclareStmt>(p, 4);
  EXPECT_EQ(e.value, nullptr);
  EXPECT_EQ(e.typeName, std::optional<std::string>("String"));
}

TEST(ParserStatements, IfElseIfElse) {
  auto p = parseBody(
      "<<if $a > 1>>\n"
      "  Big.\n"
      "<<elseif $a == 1>>\n"
      "  One.\n"
      "<<else>>\n"
      "  Small.\n"
      "  Tiny.\n"
      "<<endif>>\n"
      "Done.\n");
  ASSERT_TRUE(p.diags.empty());
  ASSERT_EQ(p.file->nodes[0]->body.size(), 2u);
  const auto& s = stmtAt<ast::IfStmt>(p, 0);
  ASSERT_EQ(s.clauses.size(), 3u);
  EXPECT_NE(s.clauses[0].cond, nullptr);
  EXPECT_NE(s.clauses[1].cond, nullptr);
  EXPECT_EQ(s.clauses[2].cond, nullptr);
  EXPECT_EQ(s.clauses[2].body.size(), 2u);
}

TEST(ParserStatements, JumpStopAndCommands) {
  auto p = parseBody(
      "<<jump Shop>>\n"
      "<<jump {$next}>>\n"
      "<<stop>>\n"
      "<<wait {$secs} seconds>>\n");
  ASSERT_TRUE(p.diags.empty());
  EXPECT_EQ(stmtAt<ast::JumpStmt>(p, 0).target, "Shop");
  EXPECT_NE(stmtAt<ast::JumpStmt>(p, 1).targetExpr, nullptr);
  EXPECT_EQ(p.file->nodes[0]->body[2]->kind, ast::NodeKind::StopStmt);
  const auto& cmd = stmtAt<ast::CommandStmt>(p, 3);
  EXPECT_EQ(cmd.text.text, "wait {0} seconds");
  EXPECT_EQ(cmd.text.substitutions.size(), 1u);
}

TEST(ParserStatements, MalformedLinesBecomeDiagnosticsAndParsingContinues) {
  auto p = parseBody(
      "<<set $a 1>>\n"
      "Broken {1 +} text\n"
      "<<declare $z>>\n"
      "<<endif>>\n"
      "<<if $x>>\n"
      "  Never closed.\n"
      "Still parsed.\n");
  EXPECT_GE(p.diags.size(), 5u);
  for (const auto& d : p.diags) {
    EXPECT_EQ(d.severity, sema::Severity::Error);
    EXPECT_EQ(d.file, "body.yarn");
  }
  EXPECT_EQ(p.diags[0].line, 3);
  EXPECT_EQ(p.diags[1].line, 4);
}
