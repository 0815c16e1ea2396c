#include <getopt.h>

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "errors.h"
#include "logger.h"
#include "reporter.h"
#include "rule_sets.h"
#include "rule_table.h"
#include "utils.h"
#include "walker.h"

namespace {

const int kExitConfigError = 2;

std::atomic<bool> g_cancel_requested{false};

void handleInterrupt(int) { g_cancel_requested.store(true); }

void printUsage(const char* program_name) {
  Logger::warn(std::string("Usage: ") + program_name +
               " [OPTIONS] <root...>");
  Logger::warn("Options:");
  Logger::warn(
      "  -r, --rules <name>       Built-in rule set (dark-mode, "
      "error-migration, semantic-colors)");
  Logger::warn("  -f, --rule-file <file>   Load rules from a rule table file");
  Logger::warn("  -n, --dry-run            Report changes without writing");
  Logger::warn("  -j, --jobs <n>           Worker threads (default: 1)");
  Logger::warn(
      "  -e, --ext <list>         Comma-separated extensions (default: "
      ".ts,.tsx,.js,.jsx)");
  Logger::warn("  -v, --verbose            Debug logging, list unchanged files");
  Logger::warn("  -q, --quiet              Only warnings and errors");
  Logger::warn("  -l, --list               List built-in rule sets");
  Logger::warn("  -h, --help               Show this help message");
  Logger::warn(std::string("Example: ") + program_name +
               " --rules dark-mode --dry-run app components");
}

void listRuleSets() {
  for (const auto& name : RuleSets::names()) {
    RuleSet set = RuleSets::byName(name);
    std::cout << name << ": " << set.description << "\n";
    for (const auto& rule : set.rules) {
      std::cout << "  " << rule.toString() << "\n";
    }
  }
}

size_t parseJobs(const std::string& text) {
  char* end = nullptr;
  long value = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0' || value <= 0) {
    throw ConfigError("Invalid job count: " + text);
  }
  return static_cast<size_t>(value);
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string rule_set_name;
  std::string rule_file;
  std::string extensions;
  std::string jobs_arg;
  bool dry_run = false;
  bool verbose = false;
  bool quiet = false;

  Logger::setLevel();

  // Parse command line options
  static struct option long_options[] = {
      {"rules", required_argument, 0, 'r'},
      {"rule-file", required_argument, 0, 'f'},
      {"dry-run", no_argument, 0, 'n'},
      {"jobs", required_argument, 0, 'j'},
      {"ext", required_argument, 0, 'e'},
      {"verbose", no_argument, 0, 'v'},
      {"quiet", no_argument, 0, 'q'},
      {"list", no_argument, 0, 'l'},
      {"help", no_argument, 0, 'h'},
      {0, 0, 0, 0}};

  int c;
  int option_index = 0;
  while ((c = getopt_long(argc, argv, "r:f:nj:e:vqlh", long_options,
                          &option_index)) != -1) {
    switch (c) {
      case 'r':
        rule_set_name = optarg;
        break;
      case 'f':
        rule_file = optarg;
        break;
      case 'n':
        dry_run = true;
        break;
      case 'j':
        jobs_arg = optarg;
        break;
      case 'e':
        extensions = optarg;
        break;
      case 'v':
        verbose = true;
        break;
      case 'q':
        quiet = true;
        break;
      case 'l':
        listRuleSets();
        return 0;
      case 'h':
        printUsage(argv[0]);
        return 0;
      case '?':
        printUsage(argv[0]);
        return kExitConfigError;
      default:
        break;
    }
  }

  if (verbose) {
    Logger::setLevel(LogLevel::DEBUG);
  } else if (quiet) {
    Logger::setLevel(LogLevel::WARN);
  }

  if (optind >= argc) {
    printUsage(argv[0]);
    return kExitConfigError;
  }

  std::vector<std::string> roots;
  for (int i = optind; i < argc; ++i) {
    roots.push_back(argv[i]);
  }

  try {
    if (rule_set_name.empty() == rule_file.empty()) {
      throw ConfigError("Exactly one of --rules or --rule-file is required");
    }
    RuleSet rule_set = rule_file.empty() ? RuleSets::byName(rule_set_name)
                                         : loadRuleTable(rule_file);
    if (rule_set.rules.empty()) {
      throw ConfigError("Rule set " + rule_set.name + " has no rules");
    }

    WalkerOptions options;
    options.dry_run = dry_run;
    options.path_filter = rule_set.path_filter;
    if (!jobs_arg.empty()) {
      options.jobs = parseJobs(jobs_arg);
    }
    if (!extensions.empty()) {
      options.extensions.clear();
      for (auto ext : Utils::splitList(extensions, ',')) {
        if (ext[0] != '.') {
          ext = "." + ext;
        }
        options.extensions.push_back(ext);
      }
    }

    RewriteEngine engine = rule_set.makeEngine();
    Walker walker(engine, options);

    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);
    walker.setCancelFlag(&g_cancel_requested);

    Logger::info("Applying rule set: " + rule_set.name);
    RunSummary summary = walker.run(roots);

    Reporter reporter(std::cout, verbose);
    reporter.setBaseDirectory(std::filesystem::current_path().string());
    reporter.printReport(summary);

    return Reporter::exitCode(summary);
  } catch (const std::exception& e) {
    Logger::error("Error: " + std::string(e.what()));
    return kExitConfigError;
  }
}
