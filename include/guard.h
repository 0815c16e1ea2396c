#ifndef GUARD_H
#define GUARD_H

#include <string>

#include "scope_scanner.h"

namespace Guard {
// True when marker is present in the scope text. An empty marker never guards.
bool isAlreadyMigrated(const Scope& scope, const std::string& marker);
bool isAlreadyMigrated(const std::string& text, const std::string& marker);

// Text an unscoped rule is guarded against: up to window_size characters
// starting at match_begin.
std::string windowAfter(const std::string& content, size_t match_begin,
                        size_t window_size);
}  // namespace Guard

#endif  // GUARD_H
