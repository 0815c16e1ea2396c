#include "rule_sets.h"

#include <filesystem>
#include <regex>

#include "errors.h"

namespace {

// Class tokens are delimited by whitespace or the quotes around the value.
const char* const kClassStart = R"(([\s"'`]))";
const char* const kClassEnd = R"((?=[\s"'`]))";

std::string escapeClass(const std::string& utility) {
  std::string escaped;
  for (char c : utility) {
    if (c == '/' || c == '.' || c == '[' || c == ']') {
      escaped += '\\';
    }
    escaped += c;
  }
  return escaped;
}

std::string classPattern(const std::string& utility) {
  return std::string(kClassStart) + escapeClass(utility) + kClassEnd;
}

Rule darkVariant(const std::string& id, const std::string& light,
                 const std::string& dark, const std::string& family) {
  Rule rule(id, classPattern(light), "$1" + light + " " + dark);
  rule.setScopeKind(ScopeKind::Attribute);
  rule.setMarker("dark:" + family);
  return rule;
}

Rule tokenSwap(const std::string& id, const std::string& from,
               const std::string& to) {
  return Rule(id, classPattern(from), "$1" + to);
}

Rule dropClass(const std::string& id, const std::string& utility) {
  // Removes the class together with the whitespace in front of it
  return Rule(id, R"(\s+)" + escapeClass(utility) + kClassEnd, "");
}

std::string catchReplacement(const RewriteContext& context) {
  std::string indent = context.indentation();
  std::string error_var = context.match.str(1);
  std::string route = RuleSets::deriveRoute(context.path);
  std::string operation = RuleSets::operationForVerb(
      RuleSets::detectHttpVerb(context.preceding));

  // Any type annotation on the variable is dropped
  std::string text = "catch (" + error_var + ") {";
  text += "\n" + indent + "  return errorResponse(" + error_var + ", {\n";
  text += indent + "    route: '" + route + "',\n";
  text += indent + "    operation: '" + operation + "'\n";
  text += indent + "  })\n";
  text += indent + "}";
  return text;
}

}  // namespace

RewriteEngine RuleSet::makeEngine() const {
  RewriteEngine engine(rules);
  if (!import.empty()) {
    engine.setImport(import);
  }
  if (!attribute_tokens.empty()) {
    engine.setScanner(ScopeScanner(attribute_tokens));
  }
  engine.setGuardWindow(guard_window);
  return engine;
}

namespace RuleSets {

RuleSet darkMode() {
  RuleSet set;
  set.name = "dark-mode";
  set.description = "Add dark: variants next to light colour utilities";
  set.rules = {
      darkVariant("dark-bg-white", "bg-white", "dark:bg-gray-900", "bg-"),
      darkVariant("dark-bg-gray-50", "bg-gray-50", "dark:bg-gray-900", "bg-"),
      darkVariant("dark-bg-gray-100", "bg-gray-100", "dark:bg-gray-800", "bg-"),
      darkVariant("dark-text-gray-900", "text-gray-900", "dark:text-gray-100",
                  "text-"),
      darkVariant("dark-text-gray-800", "text-gray-800", "dark:text-gray-200",
                  "text-"),
      darkVariant("dark-text-gray-700", "text-gray-700", "dark:text-gray-300",
                  "text-"),
      darkVariant("dark-text-gray-600", "text-gray-600", "dark:text-gray-400",
                  "text-"),
      darkVariant("dark-text-gray-500", "text-gray-500", "dark:text-gray-400",
                  "text-"),
      darkVariant("dark-border-gray-200", "border-gray-200",
                  "dark:border-gray-700", "border-"),
      darkVariant("dark-border-gray-300", "border-gray-300",
                  "dark:border-gray-600", "border-"),
  };
  return set;
}

RuleSet errorMigration() {
  RuleSet set;
  set.name = "error-migration";
  set.description =
      "Route catch blocks that build a 500 response through errorResponse()";
  set.import = ImportDeclaration{"errorResponse", "@/lib/api-response"};
  set.path_filter = R"((^|/)route\.(ts|js)$)";

  Rule rule("catch-500", R"(catch\s*\(\s*(\w+)\s*(?::\s*\w+\s*)?\)\s*\{)",
            catchReplacement);
  rule.setScopeKind(ScopeKind::Block);
  rule.setFilter(R"(\b500\b)");
  rule.setMarker("errorResponse(");
  rule.setTarget(ReplaceTarget::Scope);
  set.rules.push_back(rule);
  return set;
}

RuleSet semanticColors() {
  RuleSet set;
  set.name = "semantic-colors";
  set.description = "Replace palette colours with semantic design tokens";
  set.rules = {
      tokenSwap("token-bg-card", "bg-white", "bg-card"),
      tokenSwap("token-bg-background", "bg-gray-50", "bg-background"),
      tokenSwap("token-bg-muted", "bg-gray-100", "bg-muted"),
      tokenSwap("token-text-foreground", "text-gray-900", "text-foreground"),
      tokenSwap("token-text-muted-600", "text-gray-600",
                "text-muted-foreground"),
      tokenSwap("token-text-muted-500", "text-gray-500",
                "text-muted-foreground"),
      tokenSwap("token-border-200", "border-gray-200", "border-border"),
      tokenSwap("token-border-300", "border-gray-300", "border-border"),
      dropClass("drop-dark-bg-900", "dark:bg-gray-900"),
      dropClass("drop-dark-bg-800", "dark:bg-gray-800"),
      dropClass("drop-dark-text-100", "dark:text-gray-100"),
      dropClass("drop-dark-text-400", "dark:text-gray-400"),
      dropClass("drop-dark-border-700", "dark:border-gray-700"),
  };
  return set;
}

RuleSet byName(const std::string& name) {
  if (name == "dark-mode") {
    return darkMode();
  }
  if (name == "error-migration") {
    return errorMigration();
  }
  if (name == "semantic-colors") {
    return semanticColors();
  }
  throw ConfigError("Unknown rule set: " + name);
}

std::vector<std::string> names() {
  return {"dark-mode", "error-migration", "semantic-colors"};
}

std::string deriveRoute(const std::string& path) {
  std::string generic = "/" + std::filesystem::path(path).generic_string();

  std::string route;
  size_t app_pos = generic.rfind("/app/");
  size_t api_pos = generic.rfind("/api/");
  if (app_pos != std::string::npos) {
    route = generic.substr(app_pos + 4);
  } else if (api_pos != std::string::npos) {
    route = generic.substr(api_pos);
  } else {
    return "/" + std::filesystem::path(path).stem().string();
  }

  static const std::regex route_file(R"(/route\.(ts|js|tsx|jsx)$)");
  std::smatch match;
  if (std::regex_search(route, match, route_file)) {
    route = route.substr(0, static_cast<size_t>(match.position(0)));
  } else {
    route = std::filesystem::path(route).replace_extension().generic_string();
  }

  // Route groups like (dashboard) are not part of the URL
  static const std::regex route_group(R"(/\([^/)]*\))");
  route = std::regex_replace(route, route_group, "");
  return route.empty() ? "/" : route;
}

std::string detectHttpVerb(std::string_view preceding) {
  static const std::regex handler(
      R"(export\s+(?:async\s+function\s+|function\s+|const\s+)(GET|POST|PUT|PATCH|DELETE|HEAD|OPTIONS)\b)");

  std::string verb;
  const char* begin = preceding.data();
  const char* end = begin + preceding.size();
  for (auto it = std::cregex_iterator(begin, end, handler);
       it != std::cregex_iterator(); ++it) {
    verb = (*it)[1].str();
  }
  return verb;
}

std::string operationForVerb(const std::string& verb) {
  if (verb == "GET" || verb == "HEAD") {
    return "fetch";
  }
  if (verb == "POST") {
    return "create";
  }
  if (verb == "PUT" || verb == "PATCH") {
    return "update";
  }
  if (verb == "DELETE") {
    return "delete";
  }
  return "handle";
}

}  // namespace RuleSets
