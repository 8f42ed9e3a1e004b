#include "string_utils.hpp"

namespace StringUtils {

std::vector<std::string> split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::string::size_type start = 0;
    std::string::size_type pos;
    while ((pos = str.find(delimiter, start)) != std::string::npos) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(str.substr(start));
    return parts;
}

std::string trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string join(const std::vector<std::string>& parts, char delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> out;
    if (text.empty()) return out;
    out = split(text, '\n');
    // A trailing newline terminates the last line rather than starting a new one
    if (!out.empty() && out.back().empty()) out.pop_back();
    for (auto& line : out) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }
    return out;
}

} // namespace StringUtils
