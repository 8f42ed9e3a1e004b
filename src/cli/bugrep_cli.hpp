#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

struct CliOptions {
    enum class Command { Report, List, Help, Version };

    Command command = Command::Help;
    std::filesystem::path config_path;          // empty = default_config_path()
    std::optional<HyperlinkMode> hyperlinks;    // --hyperlinks override
    std::string template_name;
    ParameterMap params;                        // key=value arguments, in order
};

// Parse argv (without the program name). Fails with InvalidConfig on bad usage.
Result<CliOptions> parse_cli_args(const std::vector<std::string>& args);

class BugrepCLI {
public:
    // Returns the process exit code.
    int run(const CliOptions& opts);

private:
    int run_report(const CliOptions& opts);
    int run_list(const CliOptions& opts);
};

void print_usage();
