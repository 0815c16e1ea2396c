#ifndef IMPORT_INJECTOR_H
#define IMPORT_INJECTOR_H

#include <string>
#include <vector>

// A named import: import { name } from 'module'
struct ImportDeclaration {
  std::string name;
  std::string module;

  bool empty() const { return name.empty() || module.empty(); }
  std::string statement() const;
};

struct ImportResult {
  std::string content;
  bool was_added = false;
};

class ImportInjector {
 public:
  explicit ImportInjector(const ImportDeclaration& declaration);

  bool isPresent(const std::string& content) const;
  ImportResult ensureImport(const std::string& content) const;

 private:
  struct ImportStatement {
    size_t begin;
    size_t end;  // one past the line terminator of the closing line
    std::string text;
  };

  struct ImportScan {
    std::vector<ImportStatement> statements;
    size_t directive_end = 0;  // end of a leading 'use client' style line
  };

  ImportDeclaration declaration_;

  static ImportScan scan(const std::string& content);
  bool declares(const ImportStatement& statement) const;
};

#endif  // IMPORT_INJECTOR_H
