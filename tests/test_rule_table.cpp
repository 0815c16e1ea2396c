#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include "errors.h"
#include "rule_table.h"

class RuleTableTest : public ::testing::Test {
 protected:
  void SetUp() override {}

  RuleSet parse(const std::string& text) {
    std::istringstream in(text);
    return parseRuleTable(in, "rules.txt");
  }
};

TEST_F(RuleTableTest, ParsesRulesAndHeader) {
  RuleSet set = parse(
      "# dark mode rules\n"
      "name: custom-dark\n"
      "import: errorResponse from '@/lib/api-response'\n"
      "paths: /route\\.ts$\n"
      "\n"
      "- id: dark-bg-white\n"
      "  pattern: ([\\s\"'])bg-white(?=[\\s\"'])\n"
      "  scope: attribute\n"
      "  marker: dark:bg-\n"
      "  replacement: $1bg-white dark:bg-gray-900\n"
      "- id: catch\n"
      "  pattern: catch \\((\\w+)\\) \\{\n"
      "  scope: block\n"
      "  filter: 500\n"
      "  target: scope\n"
      "  replacement: catch ($1) {}\n");

  EXPECT_EQ(set.name, "custom-dark");
  EXPECT_EQ(set.import.name, "errorResponse");
  EXPECT_EQ(set.import.module, "@/lib/api-response");
  EXPECT_EQ(set.path_filter, "/route\\.ts$");
  ASSERT_EQ(set.rules.size(), 2u);

  const Rule& dark = set.rules[0];
  EXPECT_EQ(dark.getId(), "dark-bg-white");
  EXPECT_EQ(dark.getScopeKind(), ScopeKind::Attribute);
  EXPECT_EQ(dark.getMarker(), "dark:bg-");
  EXPECT_EQ(dark.getTarget(), ReplaceTarget::Match);

  const Rule& block = set.rules[1];
  EXPECT_EQ(block.getPatternSource(), "catch \\((\\w+)\\) \\{");
  EXPECT_EQ(block.getScopeKind(), ScopeKind::Block);
  EXPECT_EQ(block.getTarget(), ReplaceTarget::Scope);
  EXPECT_EQ(block.getFilterSource(), "500");
}

TEST_F(RuleTableTest, LoadedRulesRewrite) {
  RuleSet set = parse(
      "- id: dark-bg-white\n"
      "  pattern: bg-white\n"
      "  scope: attribute\n"
      "  marker: dark:bg-gray-900\n"
      "  replacement: bg-white dark:bg-gray-900\n");
  RewriteEngine engine = set.makeEngine();

  RewriteResult result =
      engine.apply("<i className=\"bg-white text-black\"/>", "/x.tsx");
  EXPECT_EQ(result.content,
            "<i className=\"bg-white dark:bg-gray-900 text-black\"/>");
}

TEST_F(RuleTableTest, ReplacementKeepsTrailingSpace) {
  RuleSet set = parse(
      "- id: pad\n"
      "  pattern: x\n"
      "  replacement: y \n");

  ASSERT_EQ(set.rules.size(), 1u);
  RuleOutcome outcome =
      set.makeEngine().applyRule(set.rules[0], "x", "/a.ts");
  EXPECT_EQ(outcome.content, "y ");
}

TEST_F(RuleTableTest, EmptyReplacementDeletes) {
  RuleSet set = parse(
      "- id: drop\n"
      "  pattern: \\s+dark:bg-gray-900\n"
      "  replacement:\n");

  RuleOutcome outcome = set.makeEngine().applyRule(
      set.rules[0], "\"bg-card dark:bg-gray-900\"", "/a.ts");
  EXPECT_EQ(outcome.content, "\"bg-card\"");
}

TEST_F(RuleTableTest, Errors) {
  EXPECT_THROW(parse("- id: a\n"), ConfigError);
  EXPECT_THROW(parse("- pattern: a\n"), ConfigError);
  EXPECT_THROW(parse("- id: a\n  pattern: ([\n"), ConfigError);
  EXPECT_THROW(parse("- id: a\n  pattern: a\n  scope: paragraph\n"),
               ConfigError);
  EXPECT_THROW(parse("- id: a\n  pattern: a\n  target: scope\n"),
               ConfigError);
  EXPECT_THROW(parse("- id: a\n  pattern: a\n  colour: red\n"), ConfigError);
  EXPECT_THROW(parse("bogus: 1\n"), ConfigError);
  EXPECT_THROW(parse("import: errorResponse\n"), ConfigError);
  EXPECT_THROW(parse("- id: a\n  no separator here\n"), ConfigError);
  EXPECT_THROW(parse("attributes: ,\n"), ConfigError);
  EXPECT_THROW(parse("window: 0\n"), ConfigError);
  EXPECT_THROW(parse("window: wide\n"), ConfigError);
}

TEST_F(RuleTableTest, AttributeTokensAndWindow) {
  std::string rules =
      "- id: dark\n"
      "  pattern: ([\\s\"'])bg-white(?=[\\s\"'])\n"
      "  scope: attribute\n"
      "  marker: dark:bg-\n"
      "  replacement: $1bg-white dark:bg-gray-900\n"
      "- id: todo\n"
      "  pattern: x\n"
      "  marker: done\n"
      "  replacement: y\n";
  std::string input = "<b tw=\"bg-white\"/> x done";

  RuleSet defaults = parse(rules);
  EXPECT_TRUE(defaults.attribute_tokens.empty());
  EXPECT_EQ(defaults.guard_window, kDefaultGuardWindow);
  EXPECT_EQ(defaults.makeEngine().apply(input, "/a.tsx").content, input);

  RuleSet custom = parse("attributes: tw=, className=\nwindow: 4\n" + rules);
  std::vector<std::string> tokens = {"tw=", "className="};
  EXPECT_EQ(custom.attribute_tokens, tokens);
  EXPECT_EQ(custom.guard_window, 4u);
  EXPECT_EQ(custom.makeEngine().apply(input, "/a.tsx").content,
            "<b tw=\"bg-white dark:bg-gray-900\"/> y done");
}

TEST_F(RuleTableTest, ErrorNamesLine) {
  try {
    parse("# header\n- id: a\n  pattern: a\n  scope: nowhere\n");
    FAIL() << "expected ConfigError";
  } catch (const ConfigError& e) {
    EXPECT_NE(std::string(e.what()).find("rules.txt:2"), std::string::npos);
  }
}

TEST_F(RuleTableTest, LoadFromFile) {
  std::string filename =
      (std::filesystem::temp_directory_path() / "srcmigrate_rules.txt")
          .string();
  {
    std::ofstream ofs(filename);
    ofs << "- id: r\n  pattern: a\n  replacement: b\n";
    ofs.close();
  }

  RuleSet set = loadRuleTable(filename);
  EXPECT_EQ(set.rules.size(), 1u);
  EXPECT_EQ(set.name, filename);

  // Clean up
  std::remove(filename.c_str());

  EXPECT_THROW(loadRuleTable(filename), ConfigError);
}
