#include "bugrep_cli.hpp"
#include "theme.hpp"
#include <ambient/config.hpp>
#include <core/constants.hpp>
#include <platform/debug_log.hpp>
#include <platform/stderr_sink.hpp>
#include <platform/terminal.hpp>
#include <iostream>

static Result<CliOptions> usage_error(const std::string& msg) {
    return Result<CliOptions>::Err(ErrorKind::InvalidConfig, msg);
}

Result<CliOptions> parse_cli_args(const std::vector<std::string>& args) {
    CliOptions opts;
    std::vector<std::string> positional;

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (a == "--help" || a == "-h") {
            opts.command = CliOptions::Command::Help;
            return Result<CliOptions>::Ok(opts);
        } else if (a == "--version") {
            opts.command = CliOptions::Command::Version;
            return Result<CliOptions>::Ok(opts);
        } else if (a == "--config") {
            if (i + 1 >= args.size()) return usage_error("--config needs a path");
            opts.config_path = args[++i];
        } else if (a == "--hyperlinks") {
            if (i + 1 >= args.size()) return usage_error("--hyperlinks needs a mode");
            auto mode = parse_hyperlink_mode(args[++i]);
            if (!mode) {
                return usage_error(fmt::format("Unknown hyperlinks mode '{}' (expected auto, always or never)",
                                               args[i]));
            }
            opts.hyperlinks = mode;
        } else if (a.size() > 1 && a[0] == '-') {
            return usage_error("Unknown option: " + a);
        } else {
            positional.push_back(a);
        }
    }

    if (positional.empty()) {
        opts.command = CliOptions::Command::Help;
        return Result<CliOptions>::Ok(opts);
    }

    if (positional[0] == "list") {
        if (positional.size() > 1) return usage_error("'list' takes no arguments");
        opts.command = CliOptions::Command::List;
        return Result<CliOptions>::Ok(opts);
    }

    opts.command = CliOptions::Command::Report;
    opts.template_name = positional[0];
    for (size_t i = 1; i < positional.size(); i++) {
        const auto& kv = positional[i];
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            return usage_error(fmt::format("Expected key=value, got '{}'", kv));
        }
        opts.params.set(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return Result<CliOptions>::Ok(opts);
}

static Result<Config> load_config(const CliOptions& opts) {
    fs::path path = opts.config_path.empty() ? default_config_path() : opts.config_path;
    auto config = Config::load(path);
    if (config.is_err()) {
        bugrep_log_error("config load", config);
        return config;
    }
    if (opts.hyperlinks) {
        config.value.set_hyperlinks(*opts.hyperlinks);
    }
    return config;
}

int BugrepCLI::run(const CliOptions& opts) {
    switch (opts.command) {
        case CliOptions::Command::Help:
            print_usage();
            return 0;
        case CliOptions::Command::Version:
            std::cout << theme::bold("bugrep") << theme::dim(std::string(" version ") + BUGREP_VERSION) << "\n";
            return 0;
        case CliOptions::Command::List:
            return run_list(opts);
        case CliOptions::Command::Report:
            return run_report(opts);
    }
    return 1;
}

int BugrepCLI::run_report(const CliOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }

    auto handle = config.value.make_handle();
    if (handle.is_err()) {
        std::cerr << theme::fail(handle.error);
        return 1;
    }

    std::optional<bool> terminal_supports;
    if (handle.value.hyperlink_mode() == HyperlinkMode::Auto) {
        terminal_supports = platform::stderr_is_tty() && platform::terminal_supports_hyperlinks();
    }

    StderrSink sink;
    CallSite site{"bugrep", 0};
    auto url = handle.value.report(opts.template_name, opts.params, site, sink, terminal_supports);
    if (url.is_err()) {
        if (url.kind == ErrorKind::UnknownTemplate) {
            std::cerr << theme::step("Run 'bugrep list' to see available templates");
        }
        return 1;
    }

    std::cout << url.value << "\n";
    return 0;
}

int BugrepCLI::run_list(const CliOptions& opts) {
    auto config = load_config(opts);
    if (config.is_err()) {
        std::cerr << theme::fail(config.error);
        return 1;
    }
    auto handle = config.value.make_handle();
    if (handle.is_err()) {
        std::cerr << theme::fail(handle.error);
        return 1;
    }

    const auto& h = handle.value;
    std::cout << theme::section(fmt::format("{}/{}", h.owner(), h.repo()));
    for (const auto& name : h.registry().names()) {
        std::cout << theme::kv(name, h.registry().find(name)->title);
    }
    std::cout << "\n";
    return 0;
}

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    bugrep "
              << theme::color::RESET << theme::color::YELLOW << "<template> [key=value ...]"
              << theme::color::RESET << theme::color::DIM
              << "   Print a bug report and its issue URL" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    bugrep list"
              << theme::color::RESET << theme::color::DIM
              << "                             List configured templates" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config PATH             Report config (default ./bugrep.yaml or $BUGREP_CONFIG)\n"
              << "    --hyperlinks MODE         auto, always or never\n"
              << "    --version                 Show version\n"
              << "    --help                    Show this help"
              << theme::color::RESET << "\n\n";
}
