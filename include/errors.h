#ifndef ERRORS_H
#define ERRORS_H

#include <stdexcept>
#include <string>

// Bad command line, unknown rule set, unreadable rule table, no usable roots.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error(message) {}
};

// A configured root directory is missing or cannot be listed.
class DiscoveryError : public std::runtime_error {
 public:
  explicit DiscoveryError(const std::string& message)
      : std::runtime_error(message) {}
};

class ReadError : public std::runtime_error {
 public:
  explicit ReadError(const std::string& message)
      : std::runtime_error(message) {}
};

class WriteError : public std::runtime_error {
 public:
  explicit WriteError(const std::string& message)
      : std::runtime_error(message) {}
};

#endif  // ERRORS_H
