#include "run_summary.h"

#include <sstream>

const char* fileStatusName(FileStatus status) {
  switch (status) {
    case FileStatus::Modified:
      return "modified";
    case FileStatus::Failed:
      return "failed";
    case FileStatus::Unchanged:
      break;
  }
  return "unchanged";
}

size_t ApplicationResult::totalModifications() const {
  size_t total = 0;
  for (const auto& pair : modifications_by_rule) {
    total += pair.second;
  }
  return total;
}

RunSummary::RunSummary()
    : files_scanned_(0),
      files_modified_(0),
      files_unchanged_(0),
      total_modifications_(0),
      dry_run_(false),
      interrupted_(false) {}

void RunSummary::addResult(const ApplicationResult& result) {
  ++files_scanned_;

  switch (result.status) {
    case FileStatus::Modified:
      ++files_modified_;
      for (const auto& pair : result.modifications_by_rule) {
        per_rule_totals_[pair.first] += pair.second;
        total_modifications_ += pair.second;
      }
      break;
    case FileStatus::Unchanged:
      ++files_unchanged_;
      break;
    case FileStatus::Failed:
      failures_.push_back(FailureRecord{result.path, result.error_detail});
      break;
  }

  results_.push_back(result);
}

void RunSummary::addDiscoveryError(const std::string& message) {
  discovery_errors_.push_back(message);
}

size_t RunSummary::getRuleTotal(const std::string& rule_id) const {
  auto it = per_rule_totals_.find(rule_id);
  if (it != per_rule_totals_.end()) {
    return it->second;
  }
  return 0;
}

std::string RunSummary::toString() const {
  std::ostringstream oss;
  oss << "RunSummary{";
  oss << "scanned: " << files_scanned_ << ", ";
  oss << "modified: " << files_modified_ << ", ";
  oss << "unchanged: " << files_unchanged_ << ", ";
  oss << "failed: " << failures_.size() << ", ";
  oss << "modifications: " << total_modifications_ << ", ";
  oss << "rules: [";
  bool first = true;
  for (const auto& pair : per_rule_totals_) {
    if (!first) oss << ", ";
    oss << pair.first << "=" << pair.second;
    first = false;
  }
  oss << "]}";
  return oss.str();
}
