#include "terminal.hpp"
#include <cstdlib>
#include <cstdio>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#  include <io.h>
#else
#  include <unistd.h>
#endif

namespace platform {

std::optional<std::string> env_var(const char* name) {
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
}

bool terminal_supports_hyperlinks() {
    if (auto term = env_var("TERM")) {
        if (term->find("xterm") != std::string::npos ||
            term->find("screen") != std::string::npos ||
            term->find("tmux") != std::string::npos) {
            return true;
        }
    }

    if (auto program = env_var("TERM_PROGRAM")) {
        if (*program == "iTerm.app" || *program == "WezTerm" ||
            *program == "Alacritty" || *program == "Windows Terminal") {
            return true;
        }
    }

    // VS Code integrated terminal
    if (env_var("VSCODE_INJECTION")) return true;

    return false;
}

bool stderr_is_tty() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(STDERR_FILENO) != 0;
#endif
}

} // namespace platform
