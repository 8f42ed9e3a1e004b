#pragma once

#include <string>
#include <memory>
#include <core/types.hpp>
#include <core/report_handle.hpp>
#include <core/output_sink.hpp>

// Process-wide reporting configuration for call sites that don't want to
// carry a ReportHandle around. Installed once; there is no reset.
namespace ambient {

// Build and install. Returns the build error unchanged if the builder is
// invalid (the slot stays free), or AlreadyInitialized if a handle is already
// installed. Concurrent installs are safe: exactly one wins.
Result<void> install(const ReportBuilder& builder);

// Install an already built handle. A handle without owner or repo (e.g. a
// default-constructed one) is rejected with EmptyOwnerOrRepo.
Result<void> install(ReportHandle handle);

bool installed();

// The installed handle, or nullptr. Lock-free once installed.
const ReportHandle* handle();

// Replace the diagnostic sink (stderr by default). Passing nullptr restores stderr.
void set_sink(std::shared_ptr<OutputSink> sink);

// Fails with NotInitialized before install().
Result<std::string> generate_url(const std::string& template_name,
                                 const ParameterMap& params);

// Writes the diagnostic block to the ambient sink and returns the URL.
// Never fails: returns "" if nothing is installed or the report can't be
// generated (the error diagnostic is still written in the latter case).
std::string report(const std::string& template_name,
                   const ParameterMap& params,
                   const CallSite& site);

} // namespace ambient

// Report through the ambient configuration, recording the call site:
//   BUGREP_REPORT("crash", {"error_type", "NPE"}, {"function", "main"});
#define BUGREP_REPORT(template_name, ...) \
    ::ambient::report((template_name), ::ParameterMap{__VA_ARGS__}, BUGREP_SITE)
