#include "import_injector.h"

#include <regex>

#include "utils.h"

namespace {

const std::regex& importStartRegex() {
  static const std::regex pattern(R"(^import[\s{*'"])");
  return pattern;
}

const std::regex& importCompleteRegex() {
  // Either a side-effect import or a statement that reached its module
  static const std::regex pattern(R"(^import\s*['"]|\bfrom\s*['"][^'"]*['"])");
  return pattern;
}

const std::regex& directiveRegex() {
  static const std::regex pattern(
      R"(^['"]use (client|server|strict)['"];?$)");
  return pattern;
}

bool isBlankOrComment(const std::string& trimmed) {
  return trimmed.empty() || trimmed.rfind("//", 0) == 0 ||
         trimmed.rfind("/*", 0) == 0 || trimmed.rfind("*", 0) == 0;
}

}  // namespace

std::string ImportDeclaration::statement() const {
  return "import { " + name + " } from '" + module + "'";
}

ImportInjector::ImportInjector(const ImportDeclaration& declaration)
    : declaration_(declaration) {}

ImportInjector::ImportScan ImportInjector::scan(const std::string& content) {
  ImportScan result;
  bool in_statement = false;
  bool seen_code = false;
  ImportStatement current{0, 0, ""};

  size_t line_begin = 0;
  while (line_begin < content.size()) {
    size_t newline = content.find('\n', line_begin);
    size_t line_end =
        (newline == std::string::npos) ? content.size() : newline + 1;
    std::string line = content.substr(line_begin, line_end - line_begin);
    std::string trimmed = Utils::trim(line);

    if (in_statement) {
      current.text += line;
      if (std::regex_search(line, importCompleteRegex()) ||
          (!trimmed.empty() && trimmed.back() == ';')) {
        current.end = line_end;
        result.statements.push_back(current);
        in_statement = false;
      }
    } else if (std::regex_search(line, importStartRegex())) {
      current = ImportStatement{line_begin, line_end, line};
      seen_code = true;
      if (std::regex_search(line, importCompleteRegex())) {
        result.statements.push_back(current);
      } else {
        in_statement = true;
      }
    } else if (!seen_code && std::regex_search(trimmed, directiveRegex())) {
      result.directive_end = line_end;
      seen_code = true;
    } else if (!isBlankOrComment(trimmed)) {
      seen_code = true;
    }

    line_begin = line_end;
  }

  return result;
}

bool ImportInjector::declares(const ImportStatement& statement) const {
  const std::string& text = statement.text;
  if (text.find("'" + declaration_.module + "'") == std::string::npos &&
      text.find("\"" + declaration_.module + "\"") == std::string::npos) {
    return false;
  }

  size_t from = text.rfind("from");
  std::string bindings = text.substr(0, from);
  std::regex name_regex("\\b" + declaration_.name + "\\b");
  return std::regex_search(bindings, name_regex);
}

bool ImportInjector::isPresent(const std::string& content) const {
  ImportScan imports = scan(content);
  for (const auto& statement : imports.statements) {
    if (declares(statement)) {
      return true;
    }
  }
  return false;
}

ImportResult ImportInjector::ensureImport(const std::string& content) const {
  ImportResult result;
  result.content = content;
  if (declaration_.empty()) {
    return result;
  }

  ImportScan imports = scan(content);
  for (const auto& statement : imports.statements) {
    if (declares(statement)) {
      return result;
    }
  }

  std::string line = declaration_.statement();
  size_t insert_at = 0;
  if (!imports.statements.empty()) {
    insert_at = imports.statements.back().end;
  } else {
    insert_at = imports.directive_end;
  }

  if (insert_at > 0 && content[insert_at - 1] != '\n') {
    line = "\n" + line;
  } else {
    line += "\n";
  }

  result.content.insert(insert_at, line);
  result.was_added = true;
  return result;
}
