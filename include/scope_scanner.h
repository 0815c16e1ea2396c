#ifndef SCOPE_SCANNER_H
#define SCOPE_SCANNER_H

#include <string>
#include <vector>

enum class ScopeKind { None, Attribute, Block };

// Span of the smallest structure enclosing a match. For attributes it covers
// the text between the quotes; for blocks it covers the braces themselves.
struct Scope {
  size_t begin = 0;
  size_t end = 0;  // one past the last character
  std::string text;
};

enum class ScopeStatus { Found, NotFound, Unterminated };

struct ScopeLookup {
  ScopeStatus status = ScopeStatus::NotFound;
  Scope scope;

  bool found() const { return status == ScopeStatus::Found; }
};

class ScopeScanner {
 public:
  ScopeScanner();
  explicit ScopeScanner(const std::vector<std::string>& attribute_tokens);

  ScopeLookup findEnclosingScope(const std::string& content,
                                 size_t match_begin, size_t match_end,
                                 ScopeKind kind) const;

  ScopeLookup findAttributeValue(const std::string& content,
                                 size_t match_begin, size_t match_end) const;
  ScopeLookup findBlock(const std::string& content, size_t match_begin,
                        size_t match_end) const;

  // Depth-counting scan starting at the '{' at open_brace.
  static ScopeLookup findBalancedBlock(const std::string& content,
                                       size_t open_brace);

 private:
  std::vector<std::string> attribute_tokens_;
};

const char* scopeKindName(ScopeKind kind);
bool parseScopeKind(const std::string& name, ScopeKind& kind);

#endif  // SCOPE_SCANNER_H
