#include "logger.h"

#include <cstdlib>

LogLevel Logger::current_level_ = LogLevel::INFO;
std::mutex Logger::mutex_;

void Logger::setLevel(LogLevel level) { current_level_ = level; }

// From environment variable LOG_LEVEL
void Logger::setLevel() {
  const char* env_level = std::getenv("LOG_LEVEL");
  if (env_level) {
    LogLevel level;
    if (parseLevel(env_level, level)) {
      current_level_ = level;
    }
  }
}

LogLevel Logger::getLevel() { return current_level_; }

bool Logger::parseLevel(const std::string& name, LogLevel& level) {
  if (name == "DEBUG") {
    level = LogLevel::DEBUG;
  } else if (name == "INFO") {
    level = LogLevel::INFO;
  } else if (name == "WARN") {
    level = LogLevel::WARN;
  } else if (name == "ERROR") {
    level = LogLevel::ERROR;
  } else {
    return false;
  }
  return true;
}

void Logger::debug(const std::string& message) {
  log(LogLevel::DEBUG, "[DEBUG]", message);
}

void Logger::info(const std::string& message) {
  log(LogLevel::INFO, "[INFO]", message);
}

void Logger::warn(const std::string& message) {
  log(LogLevel::WARN, "[WARN]", message);
}

void Logger::error(const std::string& message) {
  log(LogLevel::ERROR, "[ERROR]", message);
}

void Logger::log(LogLevel level, const std::string& prefix,
                 const std::string& message) {
  if (level < current_level_) {
    return;
  }
  // Worker threads log concurrently; keep each line whole.
  std::lock_guard<std::mutex> lock(mutex_);
  if (level == LogLevel::ERROR || level == LogLevel::WARN) {
    std::cerr << prefix << " " << message << std::endl;
  } else {
    std::cout << prefix << " " << message << std::endl;
  }
}
