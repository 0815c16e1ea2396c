#include "rewrite_engine.h"

#include <algorithm>
#include <cstddef>
#include <regex>
#include <set>

#include "guard.h"
#include "logger.h"

const char* const kImportRuleId = "import";

namespace {

size_t lineNumberAt(const std::string& content, size_t offset) {
  return 1 + static_cast<size_t>(std::count(
                 content.begin(),
                 content.begin() + std::min(offset, content.size()), '\n'));
}

// Block text with the nested blocks the rule itself opens cut out, so a
// filter sees only the statements that belong to this block.
std::string ownBlockText(const std::string& content, const Scope& scope,
                         const Rule& rule, const ScopeScanner& scanner) {
  std::string text;
  size_t kept = scope.begin;
  auto first = content.begin() + static_cast<std::ptrdiff_t>(scope.begin + 1);
  auto last = content.begin() + static_cast<std::ptrdiff_t>(scope.end);
  for (auto it = std::sregex_iterator(first, last, rule.getPattern(),
                                      std::regex_constants::match_prev_avail);
       it != std::sregex_iterator(); ++it) {
    if (it->length(0) == 0) {
      continue;
    }
    size_t nested_begin =
        scope.begin + 1 + static_cast<size_t>(it->position(0));
    if (nested_begin < kept) {
      continue;
    }
    ScopeLookup nested = scanner.findBlock(
        content, nested_begin,
        nested_begin + static_cast<size_t>(it->length(0)));
    if (!nested.found() || nested.scope.end > scope.end) {
      continue;
    }
    text.append(content, kept, nested_begin - kept);
    kept = nested.scope.end;
  }
  text.append(content, kept, scope.end - kept);
  return text;
}

}  // namespace

size_t RewriteResult::totalModifications() const {
  size_t total = 0;
  for (const auto& pair : modifications_by_rule) {
    total += pair.second;
  }
  return total;
}

RewriteEngine::RewriteEngine() {}

RewriteEngine::RewriteEngine(const std::vector<Rule>& rules) : rules_(rules) {}

void RewriteEngine::addRule(const Rule& rule) { rules_.push_back(rule); }

void RewriteEngine::setImport(const ImportDeclaration& declaration) {
  import_ = declaration;
}

RuleOutcome RewriteEngine::applyRule(const Rule& rule,
                                     const std::string& content,
                                     const std::string& path) const {
  RuleOutcome outcome;
  outcome.content.reserve(content.size());

  size_t copied = 0;  // content before this offset is already in the output
  std::set<size_t> migrated_scopes;
  const std::string& marker = rule.getMarker();

  auto begin_it =
      std::sregex_iterator(content.begin(), content.end(), rule.getPattern());
  for (auto it = begin_it; it != std::sregex_iterator(); ++it) {
    const std::smatch& match = *it;
    if (match.length(0) == 0) {
      continue;
    }
    size_t match_begin = static_cast<size_t>(match.position(0));
    size_t match_end = match_begin + static_cast<size_t>(match.length(0));

    // Already covered by an earlier replacement span
    if (match_begin < copied) {
      continue;
    }

    ScopeLookup lookup;
    const Scope* scope = nullptr;
    if (rule.getScopeKind() != ScopeKind::None) {
      lookup = scanner_.findEnclosingScope(content, match_begin, match_end,
                                           rule.getScopeKind());
      if (lookup.status == ScopeStatus::Unterminated) {
        outcome.warnings.push_back(
            "rule " + rule.getId() + ": unterminated block at line " +
            std::to_string(lineNumberAt(content, match_begin)) + ", skipped");
        continue;
      }
      if (!lookup.found()) {
        Logger::debug("Rule " + rule.getId() + ": no enclosing " +
                      scopeKindName(rule.getScopeKind()) + " at line " +
                      std::to_string(lineNumberAt(content, match_begin)) +
                      " of " + path);
        continue;
      }
      scope = &lookup.scope;
    }

    if (rule.hasFilter()) {
      std::string filtered = match.str(0);
      if (scope && rule.getScopeKind() == ScopeKind::Block) {
        filtered = ownBlockText(content, *scope, rule, scanner_);
      } else if (scope) {
        filtered = scope->text;
      }
      if (!std::regex_search(filtered, rule.getFilter())) {
        continue;
      }
    }

    if (!marker.empty()) {
      if (scope) {
        if (migrated_scopes.count(scope->begin) > 0 ||
            Guard::isAlreadyMigrated(*scope, marker)) {
          continue;
        }
      } else if (Guard::isAlreadyMigrated(
                     Guard::windowAfter(content, match_begin, guard_window_),
                     marker)) {
        continue;
      }
    }

    size_t replace_end = match_end;
    if (rule.getTarget() == ReplaceTarget::Scope && scope &&
        scope->end > replace_end) {
      replace_end = scope->end;
    }

    RewriteContext context{match, scope,
                           std::string_view(content).substr(0, match_begin),
                           path};
    std::string replacement = rule.replacementFor(context);
    if (content.compare(match_begin, replace_end - match_begin,
                        replacement) == 0) {
      continue;
    }

    outcome.content.append(content, copied, match_begin - copied);
    outcome.content.append(replacement);
    copied = replace_end;
    if (scope) {
      migrated_scopes.insert(scope->begin);
    }
    ++outcome.count;
  }

  outcome.content.append(content, copied, std::string::npos);
  return outcome;
}

RewriteResult RewriteEngine::apply(const std::string& content,
                                   const std::string& path) const {
  RewriteResult result;
  result.content = content;

  if (!import_.empty()) {
    ImportResult injected = ImportInjector(import_).ensureImport(content);
    result.content = injected.content;
    result.import_added = injected.was_added;
  }

  size_t rule_modifications = 0;
  for (const auto& rule : rules_) {
    RuleOutcome outcome = applyRule(rule, result.content, path);
    result.content = std::move(outcome.content);
    result.warnings.insert(result.warnings.end(), outcome.warnings.begin(),
                           outcome.warnings.end());
    if (outcome.count > 0) {
      result.modifications_by_rule[rule.getId()] += outcome.count;
      rule_modifications += outcome.count;
    }
  }

  if (result.import_added) {
    if (rule_modifications == 0) {
      // Nothing uses the import; leave the file as it was
      result.content = content;
      result.import_added = false;
    } else {
      result.modifications_by_rule[kImportRuleId] += 1;
    }
  }

  return result;
}
