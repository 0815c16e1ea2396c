#ifndef REPORTER_H
#define REPORTER_H

#include <iostream>
#include <string>

#include "run_summary.h"

class Reporter {
 public:
  explicit Reporter(std::ostream& out, bool show_unchanged = false);

  void setBaseDirectory(const std::string& base_dir) { base_dir_ = base_dir; }

  void printResult(const ApplicationResult& result);
  void printSummary(const RunSummary& summary);
  // Per-file lines followed by the summary block.
  void printReport(const RunSummary& summary);

  // 0 clean, 1 some file failed, 130 interrupted.
  static int exitCode(const RunSummary& summary);

 private:
  std::ostream& out_;
  bool show_unchanged_;
  std::string base_dir_;

  std::string displayPath(const std::string& path) const;
};

#endif  // REPORTER_H
