#include "walker.h"

#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <thread>

#include "errors.h"
#include "logger.h"
#include "rule.h"
#include "utils.h"

namespace fs = std::filesystem;

std::string DiskSourceStore::read(const std::string& path) {
  return Utils::readFile(path);
}

void DiskSourceStore::write(const std::string& path,
                            const std::string& content) {
  Utils::writeFileAtomic(path, content);
}

void DiskSourceStore::checkDirectory(const std::string& path) {
  std::error_code ec;
  fs::directory_iterator listing(path, ec);
  if (ec) {
    throw DiscoveryError("Cannot read directory " + path + ": " +
                         ec.message());
  }
}

Walker::Walker(const RewriteEngine& engine, const WalkerOptions& options)
    : Walker(engine, options, std::make_shared<DiskSourceStore>()) {}

Walker::Walker(const RewriteEngine& engine, const WalkerOptions& options,
               std::shared_ptr<SourceStore> store)
    : engine_(engine), options_(options), store_(store) {
  if (options_.jobs == 0) {
    options_.jobs = 1;
  }
  if (!options_.path_filter.empty()) {
    path_filter_ = compilePattern(options_.path_filter, "path filter");
  }
}

bool Walker::shouldSkipDirectory(const std::string& name) const {
  return std::find(options_.skip_dirs.begin(), options_.skip_dirs.end(),
                   name) != options_.skip_dirs.end();
}

bool Walker::isCandidate(const std::string& filepath) const {
  fs::path path(filepath);
  std::string name = path.filename().string();

  bool extension_ok = options_.extensions.empty();
  for (const auto& ext : options_.extensions) {
    if (path.extension().string() == ext) {
      extension_ok = true;
      break;
    }
  }
  if (!extension_ok) {
    return false;
  }

  for (const auto& fragment : options_.skip_name_fragments) {
    if (name.find(fragment) != std::string::npos) {
      return false;
    }
  }

  if (!options_.path_filter.empty() &&
      !std::regex_search(path.generic_string(), path_filter_)) {
    return false;
  }
  return true;
}

std::vector<std::string> Walker::discover(const std::string& root) const {
  std::error_code ec;
  if (!fs::exists(root, ec)) {
    throw DiscoveryError("Root does not exist: " + root);
  }
  if (!fs::is_directory(root, ec)) {
    throw DiscoveryError("Root is not a directory: " + root);
  }

  // The recursive iterator hides a denied root behind an empty listing
  store_->checkDirectory(root);

  std::vector<std::string> files;
  fs::recursive_directory_iterator it(
      root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw DiscoveryError("Cannot read root " + root + ": " + ec.message());
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      Logger::warn("Error while scanning " + root + ": " + ec.message());
      break;
    }
    const fs::directory_entry& entry = *it;
    std::string name = entry.path().filename().string();

    std::error_code status_ec;
    if (entry.is_directory(status_ec)) {
      if (shouldSkipDirectory(name)) {
        Logger::debug("Skipping directory: " + entry.path().string());
        it.disable_recursion_pending();
        continue;
      }
      try {
        store_->checkDirectory(entry.path().string());
      } catch (const DiscoveryError& e) {
        Logger::warn(std::string("Skipping unreadable directory: ") +
                     e.what());
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file(status_ec)) {
      continue;
    }

    std::string filepath =
        fs::absolute(entry.path()).lexically_normal().string();
    if (!isCandidate(filepath)) {
      continue;
    }

    // Write-back goes to the real file, never over the link
    std::error_code link_ec;
    if (entry.is_symlink(link_ec)) {
      fs::path target = fs::canonical(entry.path(), link_ec);
      if (link_ec) {
        Logger::warn("Cannot resolve link " + filepath + ": " +
                     link_ec.message());
        continue;
      }
      Logger::debug("Following link " + filepath + " -> " + target.string());
      filepath = target.string();
    }
    files.push_back(filepath);
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

ApplicationResult Walker::processFile(const std::string& path) const {
  ApplicationResult result(path);

  try {
    std::string original = store_->read(path);
    RewriteResult rewritten = engine_.apply(original, path);
    result.warnings = rewritten.warnings;

    if (rewritten.content == original) {
      result.status = FileStatus::Unchanged;
      return result;
    }

    if (!options_.dry_run) {
      store_->write(path, rewritten.content);
    }
    result.status = FileStatus::Modified;
    result.modifications_by_rule = rewritten.modifications_by_rule;
    Logger::debug("Rewrote " + path + " (" +
                  std::to_string(rewritten.totalModifications()) +
                  " modifications)");
  } catch (const std::exception& e) {
    result.status = FileStatus::Failed;
    result.error_detail = e.what();
    result.modifications_by_rule.clear();
    Logger::warn("Error processing " + path + ": " + e.what());
  }

  return result;
}

bool Walker::isCancelled() const {
  return cancel_ != nullptr && cancel_->load();
}

std::vector<ApplicationResult> Walker::processAll(
    const std::vector<std::string>& files, bool& interrupted) const {
  std::map<size_t, ApplicationResult> completed;
  std::mutex completed_mutex;
  std::atomic<size_t> next_index{0};

  auto worker = [&]() {
    while (!isCancelled()) {
      size_t index = next_index.fetch_add(1);
      if (index >= files.size()) {
        return;
      }
      ApplicationResult result = processFile(files[index]);
      std::lock_guard<std::mutex> lock(completed_mutex);
      completed.emplace(index, std::move(result));
    }
  };

  size_t thread_count = std::min(options_.jobs, files.size());
  if (thread_count <= 1) {
    worker();
  } else {
    std::vector<std::thread> threads;
    threads.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
      threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }

  interrupted = completed.size() < files.size();

  std::vector<ApplicationResult> results;
  results.reserve(completed.size());
  for (auto& pair : completed) {
    results.push_back(std::move(pair.second));
  }
  return results;
}

RunSummary Walker::run(const std::vector<std::string>& roots) const {
  if (engine_.getRules().empty()) {
    throw ConfigError("No rules configured");
  }
  if (roots.empty()) {
    throw ConfigError("No root directories given");
  }

  RunSummary summary;
  summary.setDryRun(options_.dry_run);

  std::set<std::string> unique_files;
  size_t readable_roots = 0;
  for (const auto& root : roots) {
    try {
      auto files = discover(root);
      ++readable_roots;
      Logger::debug("Found " + std::to_string(files.size()) +
                    " candidate files under " + root);
      unique_files.insert(files.begin(), files.end());
    } catch (const DiscoveryError& e) {
      Logger::error(e.what());
      summary.addDiscoveryError(e.what());
    }
  }

  if (readable_roots == 0) {
    throw ConfigError("None of the given roots could be read");
  }

  std::vector<std::string> files(unique_files.begin(), unique_files.end());
  Logger::info("Processing " + std::to_string(files.size()) + " files with " +
               std::to_string(engine_.getRules().size()) + " rules" +
               (options_.dry_run ? " (dry run)" : ""));

  bool interrupted = false;
  for (const auto& result : processAll(files, interrupted)) {
    summary.addResult(result);
  }
  if (interrupted) {
    Logger::warn("Interrupted after " +
                 std::to_string(summary.getFilesScanned()) + " of " +
                 std::to_string(files.size()) + " files");
  }
  summary.setInterrupted(interrupted);

  return summary;
}
