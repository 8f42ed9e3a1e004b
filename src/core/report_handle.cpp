#include "report_handle.hpp"
#include "constants.hpp"
#include "diagnostic.hpp"
#include "hyperlink.hpp"
#include "substitution.hpp"
#include "url_builder.hpp"
#include <fmt/format.h>

// ── ReportHandle ────────────────────────────────────────────────

Result<std::string> ReportHandle::generate_url(const std::string& template_name,
                                               const ParameterMap& params) const {
    const IssueTemplate* tmpl = registry_.find(template_name);
    if (!tmpl) {
        return Result<std::string>::Err(ErrorKind::UnknownTemplate,
                                        fmt::format("Template '{}' not found", template_name),
                                        template_name);
    }

    auto rendered = substitute(template_name, *tmpl, params);
    if (rendered.is_err()) {
        return Result<std::string>::Err(rendered);
    }

    const auto& issue = rendered.value;
    return Result<std::string>::Ok(
        url::build_issue_url(owner_, repo_, issue.title, issue.body, issue.labels));
}

Result<BugReport> ReportHandle::generate(const std::string& template_name,
                                         const ParameterMap& params,
                                         const CallSite& site,
                                         std::optional<bool> terminal_supports) const {
    auto url = generate_url(template_name, params);
    if (url.is_err()) {
        return Result<BugReport>::Err(url);
    }

    BugReport report;
    report.url = url.value;
    report.diagnostic = format_diagnostic(
        template_name, params, site,
        hyperlink::present(hyperlink_mode_, report.url, REPORT_LINK_TEXT, terminal_supports));
    return Result<BugReport>::Ok(std::move(report));
}

Result<std::string> ReportHandle::report(const std::string& template_name,
                                         const ParameterMap& params,
                                         const CallSite& site,
                                         OutputSink& sink,
                                         std::optional<bool> terminal_supports) const {
    auto generated = generate(template_name, params, site, terminal_supports);
    if (generated.is_err()) {
        sink.write_str(format_error_diagnostic(site, generated.error));
        return Result<std::string>::Err(generated);
    }
    sink.write_str(generated.value.diagnostic);
    return Result<std::string>::Ok(generated.value.url);
}

Result<std::string> ReportHandle::report(const std::string& template_name,
                                         const ParameterMap& params,
                                         const CallSite& site) const {
    NullSink sink;
    return report(template_name, params, site, sink);
}

// ── ReportBuilder ───────────────────────────────────────────────

ReportBuilder::ReportBuilder(std::string owner, std::string repo) {
    handle_.owner_ = std::move(owner);
    handle_.repo_ = std::move(repo);
}

void ReportBuilder::latch(const Result<void>& r) {
    if (r.is_err() && first_error_.is_ok()) {
        first_error_ = r;
    }
}

ReportBuilder& ReportBuilder::add_template(const std::string& name, IssueTemplate tmpl) {
    latch(handle_.registry_.add(name, std::move(tmpl)));
    return *this;
}

ReportBuilder& ReportBuilder::add_template_file(const std::string& name, const TemplateFile& file) {
    auto parsed = file.parse();
    if (parsed.is_err()) {
        latch(Result<void>::Err(ErrorKind::InvalidTemplateFile,
                                fmt::format("Template file '{}' is invalid: {}", name, parsed.error),
                                name));
        return *this;
    }
    return add_template(name, std::move(parsed.value));
}

ReportBuilder& ReportBuilder::hyperlinks(HyperlinkMode mode) {
    handle_.hyperlink_mode_ = mode;
    return *this;
}

Result<ReportHandle> ReportBuilder::build() const {
    if (first_error_.is_err()) {
        return Result<ReportHandle>::Err(first_error_);
    }
    if (handle_.owner_.empty() || handle_.repo_.empty()) {
        return Result<ReportHandle>::Err(ErrorKind::EmptyOwnerOrRepo,
                                         "GitHub owner and repository must both be set");
    }
    return Result<ReportHandle>::Ok(handle_);
}
