#include "reporter.h"

#include <iomanip>

#include "utils.h"

Reporter::Reporter(std::ostream& out, bool show_unchanged)
    : out_(out), show_unchanged_(show_unchanged), base_dir_(".") {}

std::string Reporter::displayPath(const std::string& path) const {
  return Utils::makeRelativePath(path, base_dir_);
}

void Reporter::printResult(const ApplicationResult& result) {
  if (result.status == FileStatus::Unchanged && !show_unchanged_ &&
      result.warnings.empty()) {
    return;
  }

  out_ << "  " << std::left << std::setw(10) << fileStatusName(result.status)
       << " " << displayPath(result.path);

  if (result.status == FileStatus::Modified) {
    out_ << " (" << result.totalModifications() << ":";
    for (const auto& pair : result.modifications_by_rule) {
      out_ << " " << pair.first << "=" << pair.second;
    }
    out_ << ")";
  } else if (result.status == FileStatus::Failed) {
    out_ << ": " << result.error_detail;
  }
  out_ << "\n";

  for (const auto& warning : result.warnings) {
    out_ << "  " << std::left << std::setw(10) << "warning"
         << " " << displayPath(result.path) << ": " << warning << "\n";
  }
}

void Reporter::printSummary(const RunSummary& summary) {
  out_ << "\nSummary\n";
  out_ << "  files scanned:       " << summary.getFilesScanned() << "\n";
  out_ << "  files modified:      " << summary.getFilesModified() << "\n";
  out_ << "  files unchanged:     " << summary.getFilesUnchanged() << "\n";
  out_ << "  files failed:        " << summary.getFailures().size() << "\n";
  out_ << "  total modifications: " << summary.getTotalModifications()
       << "\n";

  if (!summary.getPerRuleTotals().empty()) {
    out_ << "  per rule:\n";
    for (const auto& pair : summary.getPerRuleTotals()) {
      out_ << "    " << pair.first << ": " << pair.second << "\n";
    }
  }

  if (!summary.getFailures().empty()) {
    out_ << "  failures:\n";
    for (const auto& failure : summary.getFailures()) {
      out_ << "    " << displayPath(failure.path) << ": "
           << failure.error_detail << "\n";
    }
  }

  if (!summary.getDiscoveryErrors().empty()) {
    out_ << "  skipped roots:\n";
    for (const auto& error : summary.getDiscoveryErrors()) {
      out_ << "    " << error << "\n";
    }
  }

  if (summary.isDryRun()) {
    out_ << "Dry run: no files were written.\n";
  }
  if (summary.isInterrupted()) {
    out_ << "Interrupted: the summary covers completed files only.\n";
  }
  out_.flush();
}

void Reporter::printReport(const RunSummary& summary) {
  for (const auto& result : summary.getResults()) {
    printResult(result);
  }
  printSummary(summary);
}

int Reporter::exitCode(const RunSummary& summary) {
  if (summary.isInterrupted()) {
    return 130;
  }
  return summary.hasFailures() ? 1 : 0;
}
