#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "errors.h"
#include "rewrite_engine.h"

class RewriteEngineTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dark_rule = std::make_unique<Rule>("dark-bg-white", "bg-white",
                                       "bg-white dark:bg-gray-900");
    dark_rule->setScopeKind(ScopeKind::Attribute);
    dark_rule->setMarker("dark:bg-gray-900");
  }

  std::unique_ptr<Rule> dark_rule;
  RewriteEngine engine;
  const std::string path = "/src/app/page.tsx";
};

TEST_F(RewriteEngineTest, AddsVariantInsideAttribute) {
  engine.addRule(*dark_rule);
  std::string input = "<div className=\"bg-white text-black\">hi</div>";

  RewriteResult first = engine.apply(input, path);
  EXPECT_EQ(first.content,
            "<div className=\"bg-white dark:bg-gray-900 text-black\">hi</div>");
  EXPECT_EQ(first.modifications_by_rule["dark-bg-white"], 1u);

  RewriteResult second = engine.apply(first.content, path);
  EXPECT_EQ(second.content, first.content);
  EXPECT_EQ(second.totalModifications(), 0u);
}

TEST_F(RewriteEngineTest, ExistingMarkerLeavesSiteAlone) {
  std::string input =
      "<div className=\"dark:bg-gray-900 bg-white text-black\"></div>";

  RuleOutcome outcome = engine.applyRule(*dark_rule, input, path);
  EXPECT_EQ(outcome.count, 0u);
  EXPECT_EQ(outcome.content, input);
}

TEST_F(RewriteEngineTest, UnresolvedScopeIsSkipped) {
  std::string input = "const fallback = 'bg-white'\n<div id=\"bg-white\"/>";

  RuleOutcome outcome = engine.applyRule(*dark_rule, input, path);
  EXPECT_EQ(outcome.count, 0u);
  EXPECT_EQ(outcome.content, input);
  EXPECT_TRUE(outcome.warnings.empty());
}

TEST_F(RewriteEngineTest, OneSubstitutionPerScopeAndPass) {
  std::string input = "<a className=\"bg-white hover:bg-white\">";

  RuleOutcome outcome = engine.applyRule(*dark_rule, input, path);
  EXPECT_EQ(outcome.count, 1u);
  EXPECT_EQ(outcome.content,
            "<a className=\"bg-white dark:bg-gray-900 hover:bg-white\">");
}

TEST_F(RewriteEngineTest, EachAttributeIsItsOwnScope) {
  std::string input =
      "<a className=\"bg-white\"><b className=\"bg-white dark:bg-gray-900\">";

  RuleOutcome outcome = engine.applyRule(*dark_rule, input, path);
  EXPECT_EQ(outcome.count, 1u);
  EXPECT_EQ(outcome.content,
            "<a className=\"bg-white dark:bg-gray-900\"><b "
            "className=\"bg-white dark:bg-gray-900\">");
}

TEST_F(RewriteEngineTest, CaptureGroupsInStaticReplacement) {
  Rule rule("swap", R"(([\s"])text-gray-900(?=[\s"]))", "$1text-foreground");
  std::string input = "<p className=\"m-0 text-gray-900\">";

  RuleOutcome outcome = engine.applyRule(rule, input, path);
  EXPECT_EQ(outcome.count, 1u);
  EXPECT_EQ(outcome.content, "<p className=\"m-0 text-foreground\">");
}

TEST_F(RewriteEngineTest, UnscopedMarkerUsesWindow) {
  Rule rule("log", R"(console\.error\()", "logger.error(");
  rule.setMarker("// keep");
  std::string input = "console.error(a) // keep\nconsole.error(b)\n";

  RuleOutcome outcome = engine.applyRule(rule, input, path);
  EXPECT_EQ(outcome.count, 1u);
  EXPECT_EQ(outcome.content, "console.error(a) // keep\nlogger.error(b)\n");
}

TEST_F(RewriteEngineTest, FilterRestrictsScopes) {
  Rule rule("catch", R"(catch\s*\((\w+)\)\s*\{)", "catch ($1) { handled() }");
  rule.setScopeKind(ScopeKind::Block);
  rule.setTarget(ReplaceTarget::Scope);
  rule.setMarker("handled(");
  rule.setFilter(R"(\b500\b)");
  std::string input =
      "try {} catch (a) { return 404 }\ntry {} catch (b) { return 500 }\n";

  RuleOutcome outcome = engine.applyRule(rule, input, path);
  EXPECT_EQ(outcome.count, 1u);
  EXPECT_EQ(outcome.content,
            "try {} catch (a) { return 404 }\ntry {} catch (b) { handled() }\n");
}

TEST_F(RewriteEngineTest, ScopeTargetReplacesWholeNestedBlock) {
  Rule rule("catch", R"(catch\s*\((\w+)\)\s*\{)", "catch ($1) { fixed() }");
  rule.setScopeKind(ScopeKind::Block);
  rule.setTarget(ReplaceTarget::Scope);
  rule.setMarker("fixed(");
  std::string input =
      "catch (e) { if (x) { try {} catch (inner) { y() } } return e } z()";

  RuleOutcome outcome = engine.applyRule(rule, input, path);
  EXPECT_EQ(outcome.count, 1u);
  EXPECT_EQ(outcome.content, "catch (e) { fixed() } z()");
}

TEST_F(RewriteEngineTest, UnterminatedBlockWarnsAndOtherRulesStillApply) {
  Rule block_rule("catch", R"(catch\s*\((\w+)\)\s*\{)", "catch ($1) {}");
  block_rule.setScopeKind(ScopeKind::Block);
  block_rule.setTarget(ReplaceTarget::Scope);
  Rule plain_rule("rename", "oldName", "newName");
  engine.addRule(block_rule);
  engine.addRule(plain_rule);

  std::string input = "oldName()\ncatch (e) { if (x) {\n";
  RewriteResult result = engine.apply(input, path);

  EXPECT_EQ(result.content, "newName()\ncatch (e) { if (x) {\n");
  ASSERT_EQ(result.warnings.size(), 1u);
  EXPECT_NE(result.warnings[0].find("line 2"), std::string::npos);
  EXPECT_EQ(result.modifications_by_rule.count("catch"), 0u);
  EXPECT_EQ(result.modifications_by_rule["rename"], 1u);
}

TEST_F(RewriteEngineTest, RulesComposeSequentially) {
  engine.addRule(Rule("first", "alpha", "beta"));
  engine.addRule(Rule("second", "beta", "gamma"));

  RewriteResult result = engine.apply("alpha beta", path);
  EXPECT_EQ(result.content, "gamma gamma");
  EXPECT_EQ(result.modifications_by_rule["first"], 1u);
  EXPECT_EQ(result.modifications_by_rule["second"], 2u);
}

TEST_F(RewriteEngineTest, IdentityReplacementIsNotCounted) {
  Rule rule("same", "keep", "keep");

  RuleOutcome outcome = engine.applyRule(rule, "keep keep", path);
  EXPECT_EQ(outcome.count, 0u);
  EXPECT_EQ(outcome.content, "keep keep");
}

TEST_F(RewriteEngineTest, ContextSeesPrecedingTextAndPath) {
  Rule rule("ctx", "HERE", [](const RewriteContext& context) {
    return std::to_string(context.preceding.size()) + ":" + context.path +
           ":" + context.indentation() + "|";
  });

  RuleOutcome outcome = engine.applyRule(rule, "ab\n    HERE", path);
  EXPECT_EQ(outcome.content, "ab\n    7:/src/app/page.tsx:    |");
}

TEST_F(RewriteEngineTest, ImportAddedOnlyWhenRulesChangeFile) {
  engine.addRule(Rule("rename", "oldCall\\(", "newCall("));
  engine.setImport(ImportDeclaration{"newCall", "@/lib/calls"});

  RewriteResult untouched = engine.apply("import a from 'a'\nfoo()\n", path);
  EXPECT_EQ(untouched.content, "import a from 'a'\nfoo()\n");
  EXPECT_FALSE(untouched.import_added);
  EXPECT_EQ(untouched.totalModifications(), 0u);

  RewriteResult changed = engine.apply("import a from 'a'\noldCall()\n", path);
  EXPECT_EQ(changed.content,
            "import a from 'a'\nimport { newCall } from '@/lib/calls'\n"
            "newCall()\n");
  EXPECT_TRUE(changed.import_added);
  EXPECT_EQ(changed.modifications_by_rule[kImportRuleId], 1u);
}

TEST_F(RewriteEngineTest, InvalidPatternIsConfigError) {
  EXPECT_THROW(Rule("bad", "([", "x"), ConfigError);
  Rule rule("ok", "x", "y");
  EXPECT_THROW(rule.setFilter("(unclosed"), ConfigError);
}
