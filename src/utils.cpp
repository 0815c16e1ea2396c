#include "utils.h"

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "errors.h"
#include "logger.h"

namespace Utils {

std::string readFile(const std::string& filepath) {
  std::ifstream file_in(filepath, std::ios::binary);
  if (!file_in.is_open()) {
    throw ReadError("Failed to open file: " + filepath);
  }

  std::ostringstream oss;
  oss << file_in.rdbuf();
  if (file_in.bad()) {
    throw ReadError("Failed to read file: " + filepath);
  }
  return oss.str();
}

// The new content goes to a sibling temporary file which is then renamed over
// the original, so readers see either the old file or the new one. A symlink
// is followed and its target is replaced instead.
void writeFileAtomic(const std::string& filepath, const std::string& content) {
  namespace fs = std::filesystem;

  fs::path target(filepath);
  std::error_code link_ec;
  if (fs::is_symlink(target, link_ec)) {
    target = fs::canonical(target, link_ec);
    if (link_ec) {
      throw WriteError("Cannot resolve link " + filepath + ": " +
                       link_ec.message());
    }
  }
  fs::path temp_path = target;
  temp_path += ".srcmigrate." + std::to_string(getpid()) + ".tmp";

  {
    std::ofstream file_out(temp_path, std::ios::binary | std::ios::trunc);
    if (!file_out.is_open()) {
      throw WriteError("Failed to open file for writing: " +
                       temp_path.string());
    }
    file_out.write(content.data(),
                   static_cast<std::streamsize>(content.size()));
    file_out.close();
    if (file_out.fail()) {
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      throw WriteError("Failed to write file: " + temp_path.string());
    }
  }

  std::error_code ec;
  auto perms = fs::status(target, ec).permissions();
  if (!ec) {
    fs::permissions(temp_path, perms, ec);
    if (ec) {
      Logger::debug("Could not copy permissions to " + temp_path.string() +
                    ": " + ec.message());
    }
  }

  fs::rename(temp_path, target, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    throw WriteError("Failed to replace " + filepath + ": " + ec.message());
  }
}

std::string makeRelativePath(const std::string& filepath,
                             const std::string& base_dir) {
  try {
    std::filesystem::path file_path = std::filesystem::absolute(filepath);
    std::filesystem::path base_path =
        std::filesystem::absolute(base_dir).lexically_normal();

    std::error_code ec;
    std::filesystem::path rel_path =
        std::filesystem::relative(file_path, base_path, ec);

    if (!ec) {
      std::string rel_str = rel_path.string();
      // Only paths under base_dir are shortened
      if (rel_str.size() < 2 || rel_str.substr(0, 2) != "..") {
        return rel_str;
      }
    }

    return file_path.string();
  } catch (const std::exception& e) {
    Logger::warn("Error making relative path for " + filepath + ": " +
                 e.what());
    return filepath;
  }
}

std::vector<std::string> splitList(const std::string& text, char separator) {
  std::vector<std::string> items;
  std::istringstream iss(text);
  std::string item;
  while (std::getline(iss, item, separator)) {
    item = trim(item);
    if (!item.empty()) {
      items.push_back(item);
    }
  }
  return items;
}

std::string trim(const std::string& text) {
  const char* whitespace = " \t\r\n";
  size_t begin = text.find_first_not_of(whitespace);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = text.find_last_not_of(whitespace);
  return text.substr(begin, end - begin + 1);
}

}  // namespace Utils
