#ifndef RULE_TABLE_H
#define RULE_TABLE_H

#include <istream>
#include <string>

#include "rule_sets.h"

// Line-oriented rule table:
//
//   # comment
//   import: errorResponse from '@/lib/api-response'
//   paths: /route\.ts$
//   attributes: className=, class=, tw=
//   window: 80
//   - id: dark-bg-white
//     pattern: ([\s"'])bg-white(?=[\s"'])
//     scope: attribute
//     marker: dark:bg-
//     replacement: $1bg-white dark:bg-gray-900
//     filter: <regex>
//     target: match
//
// Throws ConfigError on malformed input.
RuleSet loadRuleTable(const std::string& filepath);
RuleSet parseRuleTable(std::istream& in, const std::string& source_name);

#endif  // RULE_TABLE_H
