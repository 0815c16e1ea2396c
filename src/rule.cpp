#include "rule.h"

#include <sstream>
#include <utility>

#include "errors.h"

std::regex compilePattern(const std::string& pattern, const std::string& what) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& e) {
    throw ConfigError("Invalid pattern for " + what + ": '" + pattern +
                      "' (" + e.what() + ")");
  }
}

std::string RewriteContext::indentation() const {
  size_t line_start = preceding.rfind('\n');
  line_start = (line_start == std::string_view::npos) ? 0 : line_start + 1;
  size_t indent_end = line_start;
  while (indent_end < preceding.size() &&
         (preceding[indent_end] == ' ' || preceding[indent_end] == '\t')) {
    ++indent_end;
  }
  return std::string(preceding.substr(line_start, indent_end - line_start));
}

Rule::Rule(const std::string& id, const std::string& pattern,
           const std::string& replacement)
    : id_(id),
      pattern_source_(pattern),
      pattern_(compilePattern(pattern, "rule " + id)),
      replacement_(replacement) {}

Rule::Rule(const std::string& id, const std::string& pattern,
           Replacer replacer)
    : id_(id),
      pattern_source_(pattern),
      pattern_(compilePattern(pattern, "rule " + id)),
      replacer_(std::move(replacer)) {}

void Rule::setFilter(const std::string& filter) {
  if (filter.empty()) {
    filter_source_.clear();
    filter_ = std::regex();
    return;
  }
  filter_ = compilePattern(filter, "filter of rule " + id_);
  filter_source_ = filter;
}

std::string Rule::replacementFor(const RewriteContext& context) const {
  if (replacer_) {
    return replacer_(context);
  }
  return context.match.format(replacement_);
}

std::string Rule::toString() const {
  std::ostringstream oss;
  oss << "Rule{";
  oss << "id: \"" << id_ << "\", ";
  oss << "pattern: \"" << pattern_source_ << "\", ";
  oss << "scope: " << scopeKindName(scope_kind_);
  if (!marker_.empty()) {
    oss << ", marker: \"" << marker_ << "\"";
  }
  if (hasFilter()) {
    oss << ", filter: \"" << filter_source_ << "\"";
  }
  if (target_ == ReplaceTarget::Scope) {
    oss << ", target: scope";
  }
  oss << "}";
  return oss.str();
}
