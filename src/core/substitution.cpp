#include "substitution.hpp"
#include <fmt/format.h>
#include <algorithm>

// ── Internal helpers ────────────────────────────────────────────

static bool is_name_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
}

// If a placeholder starts at `pos`, set `close` to the index of its '}'.
static bool placeholder_at(const std::string& s, size_t pos, size_t& close) {
    if (s[pos] != '{') return false;
    size_t j = pos + 1;
    while (j < s.size() && is_name_char(s[j])) j++;
    if (j == pos + 1 || j >= s.size() || s[j] != '}') return false;
    close = j;
    return true;
}

static void collect(const std::string& pattern, std::vector<std::string>& out) {
    for (size_t i = 0; i < pattern.size(); i++) {
        size_t close;
        if (!placeholder_at(pattern, i, close)) continue;
        std::string name = pattern.substr(i + 1, close - i - 1);
        if (std::find(out.begin(), out.end(), name) == out.end()) {
            out.push_back(std::move(name));
        }
        i = close;
    }
}

// Caller guarantees every placeholder has a value.
static std::string render(const std::string& pattern, const ParameterMap& params) {
    std::string out;
    out.reserve(pattern.size());
    for (size_t i = 0; i < pattern.size(); i++) {
        size_t close;
        if (placeholder_at(pattern, i, close)) {
            out += *params.find(pattern.substr(i + 1, close - i - 1));
            i = close;
        } else {
            out += pattern[i];
        }
    }
    return out;
}

// ── Public API ──────────────────────────────────────────────────

std::vector<std::string> placeholders(const std::string& pattern) {
    std::vector<std::string> names;
    collect(pattern, names);
    return names;
}

std::vector<std::string> missing_parameters(const IssueTemplate& tmpl,
                                            const ParameterMap& params) {
    std::vector<std::string> names;
    collect(tmpl.title, names);
    collect(tmpl.body, names);

    std::vector<std::string> missing;
    for (auto& name : names) {
        if (!params.contains(name)) missing.push_back(name);
    }
    return missing;
}

Result<RenderedIssue> substitute(const std::string& template_name,
                                 const IssueTemplate& tmpl,
                                 const ParameterMap& params) {
    auto missing = missing_parameters(tmpl, params);
    if (!missing.empty()) {
        std::string msg = fmt::format("Missing required parameter '{}' for template '{}'",
                                      missing.front(), template_name);
        if (missing.size() > 1) {
            msg += fmt::format(" (missing: {})", fmt::join(missing, ", "));
        }
        auto err = Result<RenderedIssue>::Err(ErrorKind::MissingParameter, msg, missing.front());
        err.context = template_name;
        return err;
    }

    RenderedIssue out;
    out.title = render(tmpl.title, params);
    out.body = render(tmpl.body, params);
    out.labels = tmpl.labels;
    return Result<RenderedIssue>::Ok(std::move(out));
}
