// Example: ambient configuration.
//
// Installs one process-wide configuration at startup, then reports from
// anywhere with BUGREP_REPORT. The diagnostic block goes to stderr and the
// URL comes back as a string (empty if the report couldn't be generated).
//
// Usage: ./basic_usage

#include <ambient/ambient.hpp>
#include <fmt/format.h>

static std::string calculate_sum() {
    return BUGREP_REPORT("crash",
                         {"error_type", "NullPointerException"},
                         {"function", "calculate_sum"},
                         {"line", "42"},
                         {"os", "linux"});
}

int main() {
    ReportBuilder builder("myorg", "myproject");
    builder
        .add_template("crash", IssueTemplate(
            "Application Crash: {error_type}",
            "## Description\nThe application crashed with error: {error_type}\n\n"
            "## Context\n- Function: {function}\n- Line: {line}\n- OS: {os}",
            {"bug", "crash"}))
        .add_template("performance", IssueTemplate(
            "Performance Issue: {operation} is too slow",
            "## Performance Problem\n\nOperation: {operation}\nExpected time: {expected}ms\n"
            "Actual time: {actual}ms",
            {"performance"}))
        .hyperlinks(HyperlinkMode::Auto);

    auto installed = ambient::install(builder);
    if (installed.is_err()) {
        fmt::print(stderr, "install failed: {}\n", installed.error);
        return 1;
    }

    std::string crash_url = calculate_sum();

    std::string perf_url = BUGREP_REPORT("performance",
                                         {"operation", "database_query"},
                                         {"expected", 100},
                                         {"actual", 1500});

    // Missing parameters: prints an error block, returns ""
    std::string broken = BUGREP_REPORT("crash");

    fmt::print("crash:       {}\nperformance: {}\nbroken:      '{}'\n", crash_url, perf_url, broken);
    return 0;
}
