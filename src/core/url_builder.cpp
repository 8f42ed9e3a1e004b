#include "url_builder.hpp"
#include "constants.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

namespace url {

static bool is_unreserved(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' || c == '~';
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string percent_encode(const std::string& input) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(input.size() * 3);
    for (unsigned char c : input) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string percent_decode(const std::string& input) {
    std::string out;
    out.reserve(input.size());
    for (size_t i = 0; i < input.size(); i++) {
        if (input[i] == '%' && i + 2 < input.size()) {
            int hi = hex_value(input[i + 1]);
            int lo = hex_value(input[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += input[i];
    }
    return out;
}

std::string build_issue_url(const std::string& owner, const std::string& repo,
                            const std::string& title, const std::string& body,
                            const std::vector<std::string>& labels) {
    std::string out = fmt::format(ISSUE_NEW_URL, owner, repo);
    out += "?title=" + percent_encode(title);
    out += "&body=" + percent_encode(body);
    if (!labels.empty()) {
        out += "&labels=" + percent_encode(StringUtils::join(labels, LABEL_SEPARATOR));
    }
    return out;
}

std::string query_param(const std::string& url, const std::string& key) {
    auto q = url.find('?');
    if (q == std::string::npos) return "";
    for (const auto& pair : StringUtils::split(url.substr(q + 1), '&')) {
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.compare(0, eq, key) == 0 && eq == key.size()) {
            return pair.substr(eq + 1);
        }
    }
    return "";
}

} // namespace url
