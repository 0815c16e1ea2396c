#ifndef UTILS_H
#define UTILS_H

#include <string>
#include <vector>

namespace Utils {
std::string readFile(const std::string& filepath);
void writeFileAtomic(const std::string& filepath, const std::string& content);
std::string makeRelativePath(const std::string& filepath,
                             const std::string& base_dir);
std::vector<std::string> splitList(const std::string& text, char separator);
std::string trim(const std::string& text);
}  // namespace Utils

#endif  // UTILS_H
