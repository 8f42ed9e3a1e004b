#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string join(const std::vector<std::string>& parts, char delimiter);

// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> lines(const std::string& text);
}
