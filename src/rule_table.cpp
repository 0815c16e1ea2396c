#include "rule_table.h"

#include <cstdlib>
#include <fstream>
#include <map>
#include <regex>
#include <set>

#include "errors.h"
#include "logger.h"
#include "utils.h"

namespace {

struct PendingRule {
  size_t line_number = 0;
  std::map<std::string, std::string> fields;
};

Rule buildRule(const PendingRule& pending, const std::string& where) {
  auto field = [&](const std::string& key) -> std::string {
    auto it = pending.fields.find(key);
    return it == pending.fields.end() ? "" : it->second;
  };

  std::string id = field("id");
  if (id.empty()) {
    throw ConfigError(where + ": rule without id");
  }
  std::string pattern = field("pattern");
  if (pattern.empty()) {
    throw ConfigError(where + ": rule " + id + " has no pattern");
  }

  Rule rule(id, pattern, field("replacement"));

  std::string scope = field("scope");
  if (!scope.empty()) {
    ScopeKind kind;
    if (!parseScopeKind(scope, kind)) {
      throw ConfigError(where + ": rule " + id + " has unknown scope '" +
                        scope + "'");
    }
    rule.setScopeKind(kind);
  }

  rule.setMarker(field("marker"));
  rule.setFilter(field("filter"));

  std::string target = field("target");
  if (target == "scope") {
    if (rule.getScopeKind() == ScopeKind::None) {
      throw ConfigError(where + ": rule " + id +
                        " targets its scope but declares none");
    }
    rule.setTarget(ReplaceTarget::Scope);
  } else if (!target.empty() && target != "match") {
    throw ConfigError(where + ": rule " + id + " has unknown target '" +
                      target + "'");
  }

  return rule;
}

ImportDeclaration parseImport(const std::string& value,
                              const std::string& where) {
  static const std::regex import_regex(R"(^(\w+)\s+from\s+['"]([^'"]+)['"]$)");
  std::smatch match;
  if (!std::regex_match(value, match, import_regex)) {
    throw ConfigError(where + ": expected \"import: <name> from '<module>'\"");
  }
  return ImportDeclaration{match[1].str(), match[2].str()};
}

size_t parseWindow(const std::string& value, const std::string& where) {
  char* end = nullptr;
  unsigned long window = std::strtoul(value.c_str(), &end, 10);
  if (value.empty() || *end != '\0' || window == 0) {
    throw ConfigError(where + ": window must be a positive number");
  }
  return static_cast<size_t>(window);
}

}  // namespace

RuleSet parseRuleTable(std::istream& in, const std::string& source_name) {
  static const std::set<std::string> rule_keys = {
      "id", "pattern", "scope", "marker", "replacement", "filter", "target"};

  RuleSet set;
  set.name = source_name;
  set.description = "Rules loaded from " + source_name;

  bool have_rule = false;
  PendingRule pending;
  auto flush = [&]() {
    if (have_rule) {
      set.rules.push_back(buildRule(
          pending, source_name + ":" + std::to_string(pending.line_number)));
    }
    pending = PendingRule();
    have_rule = false;
  };

  std::string line;
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    std::string trimmed = Utils::trim(line);
    if (trimmed.empty() || trimmed[0] == '#') {
      continue;
    }

    std::string where = source_name + ":" + std::to_string(line_number);
    bool starts_rule = trimmed.rfind("- ", 0) == 0;
    if (starts_rule) {
      flush();
      have_rule = true;
      pending.line_number = line_number;
      trimmed = Utils::trim(trimmed.substr(2));
    }

    size_t colon = trimmed.find(':');
    if (colon == std::string::npos) {
      throw ConfigError(where + ": expected 'key: value'");
    }
    std::string key = Utils::trim(trimmed.substr(0, colon));
    // Values keep their inner spacing; only the separator space is dropped
    std::string value = line.substr(line.find(':') + 1);
    if (!value.empty() && value[0] == ' ') {
      value.erase(0, 1);
    }

    if (!have_rule) {
      if (key == "import") {
        set.import = parseImport(Utils::trim(value), where);
      } else if (key == "paths") {
        set.path_filter = Utils::trim(value);
      } else if (key == "name") {
        set.name = Utils::trim(value);
      } else if (key == "attributes") {
        set.attribute_tokens = Utils::splitList(value, ',');
        if (set.attribute_tokens.empty()) {
          throw ConfigError(where + ": attributes needs at least one token");
        }
      } else if (key == "window") {
        set.guard_window = parseWindow(Utils::trim(value), where);
      } else {
        throw ConfigError(where + ": unknown key '" + key + "'");
      }
      continue;
    }

    if (rule_keys.find(key) == rule_keys.end()) {
      throw ConfigError(where + ": unknown rule key '" + key + "'");
    }
    if (key == "replacement") {
      pending.fields[key] = value;
    } else {
      pending.fields[key] = Utils::trim(value);
    }
  }
  flush();

  Logger::debug("Loaded " + std::to_string(set.rules.size()) +
                " rules from " + source_name);
  return set;
}

RuleSet loadRuleTable(const std::string& filepath) {
  std::ifstream file(filepath);
  if (!file.is_open()) {
    throw ConfigError("Cannot open rule table: " + filepath);
  }
  return parseRuleTable(file, filepath);
}
