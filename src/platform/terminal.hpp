#pragma once

#include <string>
#include <optional>

namespace platform {

// Value of an environment variable, or nullopt if it is unset.
std::optional<std::string> env_var(const char* name);

// Best guess at whether the attached terminal renders OSC 8 hyperlinks.
// Looks at TERM (xterm/screen/tmux), TERM_PROGRAM (iTerm.app, WezTerm,
// Alacritty, Windows Terminal) and VSCODE_INJECTION. Unknown terminals
// report false.
bool terminal_supports_hyperlinks();

// True if stderr is attached to a terminal.
bool stderr_is_tty();

} // namespace platform
