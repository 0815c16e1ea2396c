#ifndef RUN_SUMMARY_H
#define RUN_SUMMARY_H

#include <map>
#include <string>
#include <vector>

enum class FileStatus { Unchanged, Modified, Failed };

const char* fileStatusName(FileStatus status);

// Outcome of processing one file.
struct ApplicationResult {
  std::string path;
  FileStatus status = FileStatus::Unchanged;
  std::map<std::string, size_t> modifications_by_rule;
  std::string error_detail;
  std::vector<std::string> warnings;

  ApplicationResult() = default;
  explicit ApplicationResult(const std::string& p) : path(p) {}

  size_t totalModifications() const;
};

struct FailureRecord {
  std::string path;
  std::string error_detail;
};

class RunSummary {
 public:
  RunSummary();

  // Folds one file's result into the run totals.
  void addResult(const ApplicationResult& result);
  void addDiscoveryError(const std::string& message);

  size_t getFilesScanned() const { return files_scanned_; }
  size_t getFilesModified() const { return files_modified_; }
  size_t getFilesUnchanged() const { return files_unchanged_; }
  size_t getTotalModifications() const { return total_modifications_; }
  const std::map<std::string, size_t>& getPerRuleTotals() const {
    return per_rule_totals_;
  }
  const std::vector<FailureRecord>& getFailures() const { return failures_; }
  const std::vector<ApplicationResult>& getResults() const { return results_; }
  const std::vector<std::string>& getDiscoveryErrors() const {
    return discovery_errors_;
  }

  bool hasFailures() const { return !failures_.empty(); }
  size_t getRuleTotal(const std::string& rule_id) const;

  bool isDryRun() const { return dry_run_; }
  void setDryRun(bool dry_run) { dry_run_ = dry_run; }
  bool isInterrupted() const { return interrupted_; }
  void setInterrupted(bool interrupted) { interrupted_ = interrupted; }

  std::string toString() const;

 private:
  size_t files_scanned_;
  size_t files_modified_;
  size_t files_unchanged_;
  size_t total_modifications_;
  std::map<std::string, size_t> per_rule_totals_;
  std::vector<FailureRecord> failures_;
  std::vector<ApplicationResult> results_;
  std::vector<std::string> discovery_errors_;
  bool dry_run_;
  bool interrupted_;
};

#endif  // RUN_SUMMARY_H
