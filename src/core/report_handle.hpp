#pragma once

#include <string>
#include <optional>
#include "types.hpp"
#include "issue_template.hpp"
#include "template_registry.hpp"
#include "output_sink.hpp"

struct BugReport {
    std::string url;            // plain URL, never hyperlink-wrapped
    std::string diagnostic;     // multi-line block for an error sink
};

// Self-contained reporting configuration: repository, templates and hyperlink
// mode. Holds no shared state, so independent handles can be used from any
// thread without coordination. Built by ReportBuilder.
class ReportHandle {
public:
    ReportHandle() = default;

    const std::string& owner() const { return owner_; }
    const std::string& repo() const { return repo_; }
    const TemplateRegistry& registry() const { return registry_; }
    HyperlinkMode hyperlink_mode() const { return hyperlink_mode_; }

    // Fails with UnknownTemplate or MissingParameter.
    Result<std::string> generate_url(const std::string& template_name,
                                     const ParameterMap& params) const;

    // URL plus the diagnostic block. `terminal_supports` feeds HyperlinkMode::Auto;
    // leave it empty where nothing can probe the terminal.
    Result<BugReport> generate(const std::string& template_name,
                               const ParameterMap& params,
                               const CallSite& site,
                               std::optional<bool> terminal_supports = std::nullopt) const;

    // Writes the diagnostic (or an error diagnostic) to `sink` and returns the URL.
    Result<std::string> report(const std::string& template_name,
                               const ParameterMap& params,
                               const CallSite& site,
                               OutputSink& sink,
                               std::optional<bool> terminal_supports = std::nullopt) const;

    // Same, without any output.
    Result<std::string> report(const std::string& template_name,
                               const ParameterMap& params,
                               const CallSite& site) const;

private:
    std::string owner_;
    std::string repo_;
    TemplateRegistry registry_;
    HyperlinkMode hyperlink_mode_ = HyperlinkMode::Auto;

    friend class ReportBuilder;
};

// Collects templates for a repository, then produces a ReportHandle.
// Registration failures are remembered and returned by build(); the first
// one wins, and later calls keep going so the chain can be written fluently.
class ReportBuilder {
public:
    ReportBuilder(std::string owner, std::string repo);

    ReportBuilder& add_template(const std::string& name, IssueTemplate tmpl);

    // Parses the file content now; an invalid file is reported by build().
    ReportBuilder& add_template_file(const std::string& name, const TemplateFile& file);

    ReportBuilder& hyperlinks(HyperlinkMode mode);

    const TemplateRegistry& registry() const { return handle_.registry_; }

    // First registration error, else EmptyOwnerOrRepo, else the handle.
    Result<ReportHandle> build() const;

private:
    void latch(const Result<void>& r);

    ReportHandle handle_;
    Result<void> first_error_ = Result<void>::Ok();
};

// Report through an explicit handle, recording the call site. Parameters are
// {key, value} pairs:
//   BUGREP_REPORT_WITH(handle, "crash", {"error_type", "NPE"}, {"line", "42"});
#define BUGREP_REPORT_WITH(handle, template_name, ...) \
    (handle).report((template_name), ::ParameterMap{__VA_ARGS__}, BUGREP_SITE)

// Same, writing the diagnostic block to `sink`.
#define BUGREP_REPORT_TO(handle, sink, template_name, ...) \
    (handle).report((template_name), ::ParameterMap{__VA_ARGS__}, BUGREP_SITE, (sink))
