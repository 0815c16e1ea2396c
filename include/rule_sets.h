#ifndef RULE_SETS_H
#define RULE_SETS_H

#include <string>
#include <string_view>
#include <vector>

#include "import_injector.h"
#include "rewrite_engine.h"
#include "rule.h"

struct RuleSet {
  std::string name;
  std::string description;
  std::vector<Rule> rules;
  ImportDeclaration import;
  std::string path_filter;  // restricts which discovered files are processed
  std::vector<std::string> attribute_tokens;  // empty keeps className=, class=
  size_t guard_window = kDefaultGuardWindow;

  RewriteEngine makeEngine() const;
};

namespace RuleSets {
RuleSet darkMode();
RuleSet errorMigration();
RuleSet semanticColors();

// Throws ConfigError for an unknown name.
RuleSet byName(const std::string& name);
std::vector<std::string> names();

// app/api/admin/perks/route.ts -> /api/admin/perks
std::string deriveRoute(const std::string& path);
// Verb of the last exported route handler in the given text, or "".
std::string detectHttpVerb(std::string_view preceding);
std::string operationForVerb(const std::string& verb);
}  // namespace RuleSets

#endif  // RULE_SETS_H
