#include "diagnostic.hpp"
#include "constants.hpp"
#include <fmt/format.h>

static std::string marker_line(const CallSite& site) {
    return fmt::format("{} {}:{}\n", BUG_MARKER, site.file, site.line);
}

std::string format_diagnostic(const std::string& template_name,
                              const ParameterMap& params,
                              const CallSite& site,
                              const std::string& link_line) {
    std::string s = marker_line(site);
    s += fmt::format("{}Template: {}\n", DIAG_INDENT, template_name);
    if (!params.empty()) {
        s += fmt::format("{}Parameters:\n", DIAG_INDENT);
        for (const auto& [key, value] : params) {
            s += fmt::format("{}{}: {}\n", DIAG_PARAM_INDENT, key, value);
        }
    }
    s += fmt::format("{}{}\n", DIAG_INDENT, link_line);
    s += "\n";
    return s;
}

std::string format_error_diagnostic(const CallSite& site, const std::string& message) {
    std::string s = marker_line(site);
    s += fmt::format("{}Error generating bug report: {}\n", DIAG_INDENT, message);
    s += "\n";
    return s;
}
