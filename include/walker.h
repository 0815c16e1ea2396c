#ifndef WALKER_H
#define WALKER_H

#include <atomic>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include "rewrite_engine.h"
#include "run_summary.h"

// Where file content comes from and goes back to.
class SourceStore {
 public:
  virtual ~SourceStore() = default;
  virtual std::string read(const std::string& path) = 0;
  virtual void write(const std::string& path, const std::string& content) = 0;
  // Throws DiscoveryError when the directory cannot be listed.
  virtual void checkDirectory(const std::string& path) = 0;
};

class DiskSourceStore : public SourceStore {
 public:
  std::string read(const std::string& path) override;
  void write(const std::string& path, const std::string& content) override;
  void checkDirectory(const std::string& path) override;
};

struct WalkerOptions {
  std::vector<std::string> extensions = {".ts", ".tsx", ".js", ".jsx"};
  std::vector<std::string> skip_dirs = {"node_modules", ".next", "dist",
                                        "build",        ".git",  "coverage"};
  std::vector<std::string> skip_name_fragments = {".test.", ".spec."};
  std::string path_filter;  // regex searched in the path; empty matches all
  bool dry_run = false;
  size_t jobs = 1;
};

class Walker {
 public:
  Walker(const RewriteEngine& engine, const WalkerOptions& options);
  Walker(const RewriteEngine& engine, const WalkerOptions& options,
         std::shared_ptr<SourceStore> store);

  RunSummary run(const std::vector<std::string>& roots) const;

  // Sorted candidate files under root, symlinks resolved to their targets.
  // Throws DiscoveryError.
  std::vector<std::string> discover(const std::string& root) const;
  ApplicationResult processFile(const std::string& path) const;

  // Checked between files; set it to stop taking new work.
  void setCancelFlag(const std::atomic<bool>* cancel) { cancel_ = cancel; }

 private:
  const RewriteEngine& engine_;
  WalkerOptions options_;
  std::shared_ptr<SourceStore> store_;
  std::regex path_filter_;
  const std::atomic<bool>* cancel_ = nullptr;

  bool isCandidate(const std::string& filepath) const;
  bool shouldSkipDirectory(const std::string& name) const;
  bool isCancelled() const;
  std::vector<ApplicationResult> processAll(
      const std::vector<std::string>& files, bool& interrupted) const;
};

#endif  // WALKER_H
