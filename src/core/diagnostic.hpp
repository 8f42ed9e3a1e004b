#pragma once

#include <string>
#include "types.hpp"

// Diagnostic block for a generated report:
//
//   🐛 BUG ENCOUNTERED in src/main.cpp:45
//      Template: crash
//      Parameters:
//        error_type: NullPointerException
//      File a bug report: https://github.com/...
//   <blank line>
//
// The Parameters block is left out when there are none. `link_line` is the
// already-presented report action (plain or OSC 8).
std::string format_diagnostic(const std::string& template_name,
                              const ParameterMap& params,
                              const CallSite& site,
                              const std::string& link_line);

// Same marker line, followed by the reason no report could be generated.
std::string format_error_diagnostic(const CallSite& site, const std::string& message);
