#ifndef REWRITE_ENGINE_H
#define REWRITE_ENGINE_H

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "import_injector.h"
#include "rule.h"
#include "scope_scanner.h"

// Key under which an injected import is counted.
extern const char* const kImportRuleId;

// Characters after the match searched for the marker of an unscoped rule.
const size_t kDefaultGuardWindow = 80;

struct RuleOutcome {
  std::string content;
  size_t count = 0;
  std::vector<std::string> warnings;
};

struct RewriteResult {
  std::string content;
  std::map<std::string, size_t> modifications_by_rule;
  std::vector<std::string> warnings;
  bool import_added = false;

  size_t totalModifications() const;
};

class RewriteEngine {
 public:
  RewriteEngine();
  explicit RewriteEngine(const std::vector<Rule>& rules);

  void addRule(const Rule& rule);
  void setImport(const ImportDeclaration& declaration);
  void setScanner(const ScopeScanner& scanner) { scanner_ = scanner; }
  void setGuardWindow(size_t window) { guard_window_ = window; }

  const std::vector<Rule>& getRules() const { return rules_; }

  // One rule over the whole content, left to right.
  RuleOutcome applyRule(const Rule& rule, const std::string& content,
                        const std::string& path) const;

  // Import first, then every rule against the previous rule's output. The
  // import is kept only when some rule changed the file.
  RewriteResult apply(const std::string& content,
                      const std::string& path) const;

 private:
  std::vector<Rule> rules_;
  ImportDeclaration import_;
  ScopeScanner scanner_;
  size_t guard_window_ = kDefaultGuardWindow;
};

#endif  // REWRITE_ENGINE_H
