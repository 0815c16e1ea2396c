#include "guard.h"

namespace Guard {

bool isAlreadyMigrated(const Scope& scope, const std::string& marker) {
  return isAlreadyMigrated(scope.text, marker);
}

bool isAlreadyMigrated(const std::string& text, const std::string& marker) {
  if (marker.empty()) {
    return false;
  }
  return text.find(marker) != std::string::npos;
}

std::string windowAfter(const std::string& content, size_t match_begin,
                        size_t window_size) {
  if (match_begin >= content.size()) {
    return "";
  }
  return content.substr(match_begin, window_size);
}

}  // namespace Guard
