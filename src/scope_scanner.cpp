#include "scope_scanner.h"

ScopeScanner::ScopeScanner() : ScopeScanner({"className=", "class="}) {}

ScopeScanner::ScopeScanner(const std::vector<std::string>& attribute_tokens)
    : attribute_tokens_(attribute_tokens) {}

ScopeLookup ScopeScanner::findEnclosingScope(const std::string& content,
                                             size_t match_begin,
                                             size_t match_end,
                                             ScopeKind kind) const {
  switch (kind) {
    case ScopeKind::Attribute:
      return findAttributeValue(content, match_begin, match_end);
    case ScopeKind::Block:
      return findBlock(content, match_begin, match_end);
    case ScopeKind::None:
      break;
  }
  return ScopeLookup();
}

ScopeLookup ScopeScanner::findAttributeValue(const std::string& content,
                                             size_t match_begin,
                                             size_t match_end) const {
  ScopeLookup lookup;
  if (match_begin > content.size() || match_end > content.size()) {
    return lookup;
  }

  // Nearest attribute-name token at or before the match
  size_t token_pos = std::string::npos;
  size_t token_end = 0;
  for (const auto& token : attribute_tokens_) {
    if (token.empty()) {
      continue;
    }
    size_t pos = content.rfind(token, match_begin);
    if (pos == std::string::npos) {
      continue;
    }
    if (token_pos == std::string::npos || pos > token_pos) {
      token_pos = pos;
      token_end = pos + token.size();
    }
  }
  if (token_pos == std::string::npos) {
    return lookup;
  }

  // The value is either quoted right after the token or is a string inside
  // the {...} expression that follows it.
  size_t value_start = content.find_first_not_of(" \t\r\n", token_end);
  if (value_start == std::string::npos) {
    return lookup;
  }

  size_t open_quote = std::string::npos;
  size_t close_quote = std::string::npos;
  if (content[value_start] == '"' || content[value_start] == '\'') {
    open_quote = value_start;
    close_quote = content.find(content[open_quote], open_quote + 1);
  } else if (content[value_start] == '{') {
    ScopeLookup expression = findBalancedBlock(content, value_start);
    if (!expression.found()) {
      return lookup;
    }
    size_t limit = expression.scope.end;
    size_t pos = value_start + 1;
    while (pos < limit) {
      size_t open = content.find_first_of("\"'`", pos);
      if (open >= limit) {
        break;
      }
      size_t close = content.find(content[open], open + 1);
      if (close == std::string::npos || close >= limit) {
        break;
      }
      if (match_begin >= open && match_end <= close) {
        open_quote = open;
        close_quote = close;
        break;
      }
      pos = close + 1;
    }
  }
  if (open_quote == std::string::npos || close_quote == std::string::npos) {
    return lookup;
  }

  // The match may begin on the opening quote (patterns use it as a class
  // boundary) but must not run past the closing one.
  if (match_begin < open_quote || match_end > close_quote) {
    return lookup;
  }

  lookup.status = ScopeStatus::Found;
  lookup.scope.begin = open_quote + 1;
  lookup.scope.end = close_quote;
  lookup.scope.text =
      content.substr(lookup.scope.begin, close_quote - lookup.scope.begin);
  return lookup;
}

ScopeLookup ScopeScanner::findBlock(const std::string& content,
                                    size_t match_begin,
                                    size_t match_end) const {
  ScopeLookup lookup;
  size_t open_brace = content.find('{', match_begin);
  if (open_brace == std::string::npos) {
    return lookup;
  }

  // The brace has to belong to the matched construct: either inside the
  // match or separated from it by whitespace only.
  if (open_brace >= match_end) {
    for (size_t i = match_end; i < open_brace; ++i) {
      char c = content[i];
      if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
        return lookup;
      }
    }
  }

  return findBalancedBlock(content, open_brace);
}

ScopeLookup ScopeScanner::findBalancedBlock(const std::string& content,
                                            size_t open_brace) {
  ScopeLookup lookup;
  if (open_brace >= content.size() || content[open_brace] != '{') {
    return lookup;
  }

  long depth = 0;
  for (size_t i = open_brace; i < content.size(); ++i) {
    char c = content[i];
    if (c == '\\') {
      ++i;  // escaped character never counts
      continue;
    }
    if (c == '{') {
      ++depth;
    } else if (c == '}') {
      --depth;
      if (depth == 0) {
        lookup.status = ScopeStatus::Found;
        lookup.scope.begin = open_brace;
        lookup.scope.end = i + 1;
        lookup.scope.text = content.substr(open_brace, i + 1 - open_brace);
        return lookup;
      }
    }
  }

  lookup.status = ScopeStatus::Unterminated;
  return lookup;
}

const char* scopeKindName(ScopeKind kind) {
  switch (kind) {
    case ScopeKind::Attribute:
      return "attribute";
    case ScopeKind::Block:
      return "block";
    case ScopeKind::None:
      break;
  }
  return "none";
}

bool parseScopeKind(const std::string& name, ScopeKind& kind) {
  if (name == "none") {
    kind = ScopeKind::None;
  } else if (name == "attribute") {
    kind = ScopeKind::Attribute;
  } else if (name == "block") {
    kind = ScopeKind::Block;
  } else {
    return false;
  }
  return true;
}
