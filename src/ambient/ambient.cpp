#include "ambient.hpp"
#include <platform/debug_log.hpp>
#include <platform/stderr_sink.hpp>
#include <platform/terminal.hpp>
#include <fmt/format.h>
#include <atomic>
#include <mutex>

namespace ambient {

namespace {

struct AmbientState {
    std::mutex mu;
    std::unique_ptr<const ReportHandle> storage;     // written once under mu
    std::atomic<const ReportHandle*> published{nullptr};

    std::mutex sink_mu;
    std::shared_ptr<OutputSink> sink;

    static AmbientState& instance() {
        static AmbientState state;
        return state;
    }
};

std::shared_ptr<OutputSink> current_sink() {
    auto& st = AmbientState::instance();
    std::lock_guard<std::mutex> lock(st.sink_mu);
    if (!st.sink) st.sink = std::make_shared<StderrSink>();
    return st.sink;
}

} // namespace

Result<void> install(const ReportBuilder& builder) {
    auto built = builder.build();
    if (built.is_err()) {
        bugrep_log_error("ambient install", built);
        return Result<void>::Err(built);
    }
    return install(std::move(built.value));
}

Result<void> install(ReportHandle h) {
    if (h.owner().empty() || h.repo().empty()) {
        auto err = Result<void>::Err(ErrorKind::EmptyOwnerOrRepo,
                                     "GitHub owner and repository must both be set");
        bugrep_log_error("ambient install", err);
        return err;
    }

    auto& st = AmbientState::instance();
    std::lock_guard<std::mutex> lock(st.mu);
    if (st.storage) {
        return Result<void>::Err(ErrorKind::AlreadyInitialized,
                                 "Bug reporting already initialized");
    }
    st.storage = std::make_unique<const ReportHandle>(std::move(h));
    st.published.store(st.storage.get(), std::memory_order_release);
    bugrep_log(fmt::format("ambient installed for {}/{} ({} templates, hyperlinks={})",
                           st.storage->owner(), st.storage->repo(),
                           st.storage->registry().size(),
                           hyperlink_mode_name(st.storage->hyperlink_mode())));
    return Result<void>::Ok();
}

bool installed() {
    return handle() != nullptr;
}

const ReportHandle* handle() {
    return AmbientState::instance().published.load(std::memory_order_acquire);
}

void set_sink(std::shared_ptr<OutputSink> sink) {
    auto& st = AmbientState::instance();
    std::lock_guard<std::mutex> lock(st.sink_mu);
    st.sink = std::move(sink);
}

Result<std::string> generate_url(const std::string& template_name,
                                 const ParameterMap& params) {
    const ReportHandle* h = handle();
    if (!h) {
        return Result<std::string>::Err(ErrorKind::NotInitialized,
                                        "Bug reporting not initialized; call ambient::install() first");
    }
    return h->generate_url(template_name, params);
}

std::string report(const std::string& template_name,
                   const ParameterMap& params,
                   const CallSite& site) {
    const ReportHandle* h = handle();
    if (!h) {
        bugrep_log(fmt::format("report '{}' at {}:{} ignored: not initialized",
                               template_name, site.file, site.line));
        return "";
    }

    std::optional<bool> terminal_supports;
    if (h->hyperlink_mode() == HyperlinkMode::Auto) {
        terminal_supports = platform::terminal_supports_hyperlinks();
    }

    auto sink = current_sink();
    auto r = h->report(template_name, params, site, *sink, terminal_supports);
    if (r.is_err()) {
        bugrep_log_error(fmt::format("report '{}' at {}:{}", template_name, site.file, site.line), r);
        return "";
    }
    return r.value;
}

} // namespace ambient
