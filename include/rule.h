#ifndef RULE_H
#define RULE_H

#include <functional>
#include <regex>
#include <string>
#include <string_view>

#include "scope_scanner.h"

enum class ReplaceTarget {
  Match,  // only the matched text
  Scope   // from the match start through the end of the resolved scope
};

// Read-only view handed to replacement functions.
struct RewriteContext {
  const std::smatch& match;
  const Scope* scope;          // nullptr for unscoped rules
  std::string_view preceding;  // file content before the match
  const std::string& path;

  // Leading whitespace of the line the match starts on.
  std::string indentation() const;
};

using Replacer = std::function<std::string(const RewriteContext&)>;

class Rule {
 public:
  // replacement may reference capture groups as $1, $2, ...
  Rule(const std::string& id, const std::string& pattern,
       const std::string& replacement);
  Rule(const std::string& id, const std::string& pattern, Replacer replacer);

  const std::string& getId() const { return id_; }
  const std::string& getPatternSource() const { return pattern_source_; }
  const std::regex& getPattern() const { return pattern_; }
  ScopeKind getScopeKind() const { return scope_kind_; }
  const std::string& getMarker() const { return marker_; }
  ReplaceTarget getTarget() const { return target_; }
  bool hasFilter() const { return !filter_source_.empty(); }
  const std::string& getFilterSource() const { return filter_source_; }
  const std::regex& getFilter() const { return filter_; }

  void setScopeKind(ScopeKind kind) { scope_kind_ = kind; }
  void setMarker(const std::string& marker) { marker_ = marker; }
  void setTarget(ReplaceTarget target) { target_ = target; }
  void setFilter(const std::string& filter);

  std::string replacementFor(const RewriteContext& context) const;
  std::string toString() const;

 private:
  std::string id_;
  std::string pattern_source_;
  std::regex pattern_;
  ScopeKind scope_kind_ = ScopeKind::None;
  std::string marker_;
  ReplaceTarget target_ = ReplaceTarget::Match;
  std::string filter_source_;
  std::regex filter_;
  std::string replacement_;
  Replacer replacer_;
};

std::regex compilePattern(const std::string& pattern, const std::string& what);

#endif  // RULE_H
