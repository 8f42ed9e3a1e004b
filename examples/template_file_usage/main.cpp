// Example: templates loaded from markdown files.
//
// The first non-empty line of each file is the issue title; the rest is the
// body. Files are read once at startup.
//
// Usage: ./template_file_usage [template-dir]

#include <ambient/ambient.hpp>
#include <platform/template_loader.hpp>
#include <fmt/format.h>
#include <filesystem>

#ifndef BUGREP_EXAMPLE_TEMPLATE_DIR
#define BUGREP_EXAMPLE_TEMPLATE_DIR "examples/templates"
#endif

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    fs::path dir = argc > 1 ? fs::path(argv[1]) : fs::path(BUGREP_EXAMPLE_TEMPLATE_DIR);

    auto crash = platform::load_template_file(dir / "crash_report.md", {"bug", "crash"});
    auto perf = platform::load_template_file(dir / "performance_issue.md", {"performance", "optimization"});
    for (const auto* r : {&crash, &perf}) {
        if (r->is_err()) {
            fmt::print(stderr, "{}\n", r->error);
            return 1;
        }
    }

    ReportBuilder builder("myorg", "myproject");
    builder.add_template_file("crash", crash.value)
           .add_template_file("performance", perf.value);

    auto installed = ambient::install(builder);
    if (installed.is_err()) {
        fmt::print(stderr, "install failed: {}\n", installed.error);
        return 1;
    }

    BUGREP_REPORT("crash",
                  {"error_type", "NullPointerException"},
                  {"function", "calculate_sum"},
                  {"line", "42"},
                  {"os", "linux"},
                  {"step1", "Open the application"},
                  {"step2", "Click on calculate button"},
                  {"step3", "Application crashes"},
                  {"expected_behavior", "Should calculate the sum correctly"});

    BUGREP_REPORT("performance",
                  {"operation", "database_query"},
                  {"expected", "100"},
                  {"actual", "1500"},
                  {"hardware", "Intel i7-12700K, 32GB RAM"},
                  {"impact_description", "User experience is significantly degraded"});
    return 0;
}
