// Example: explicit handle, core library only.
//
// Nothing here touches ambient state, the environment or stderr, so the same
// code runs where none of those exist. The host decides where text goes by
// supplying an OutputSink.
//
// Usage: ./handle_usage

#include <core/report_handle.hpp>
#include <cstdio>

// Stands in for whatever the host has instead of stderr (a UART, a ring buffer...)
class ConsoleSink : public OutputSink {
public:
    void write_str(const std::string& s) override {
        std::fwrite(s.data(), 1, s.size(), stdout);
    }
};

static void report_from_another_module(const ReportHandle& handle, OutputSink& sink) {
    auto url = BUGREP_REPORT_TO(handle, sink, "performance",
                                {"operation", "file_read"},
                                {"expected", "50"},
                                {"actual", "300"});
    if (url.is_err()) {
        sink.print("performance report failed: {}\n", url.error);
    }
}

int main() {
    auto built = ReportBuilder("myorg", "shared-project")
        .add_template("crash", IssueTemplate(
            "Application Crash: {error_type}",
            "## Description\nThe application crashed with error: {error_type}\n\n"
            "## Context\n- Function: {function}\n- Line: {line}",
            {"bug", "crash"}))
        .add_template("performance", IssueTemplate(
            "Performance Issue: {operation} is too slow",
            "Operation: {operation}\nExpected: {expected}ms\nActual: {actual}ms"))
        .hyperlinks(HyperlinkMode::Never)
        .build();
    if (built.is_err()) {
        std::fprintf(stderr, "build failed: %s\n", built.error.c_str());
        return 1;
    }
    const ReportHandle& handle = built.value;

    ConsoleSink sink;
    auto crash = BUGREP_REPORT_TO(handle, sink, "crash",
                                  {"error_type", "NullPointerException"},
                                  {"function", "calculate_sum"},
                                  {"line", "42"});
    if (crash.is_err()) return 1;

    // Direct URL generation, no diagnostic output
    ParameterMap params;
    params.set("error_type", "MemoryLeak")
          .set("function", "allocate_buffer")
          .set("line", "123");
    auto direct = handle.generate_url("crash", params);
    if (direct.is_ok()) {
        sink.print("Direct URL generation: {}\n", direct.value);
    }

    // Handles are plain values: copy one into another component
    ReportHandle copy = handle;
    report_from_another_module(copy, sink);
    return 0;
}
