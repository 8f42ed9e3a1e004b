#pragma once

#include <string>
#include <optional>
#include "types.hpp"

namespace hyperlink {

// OSC 8 terminal hyperlink: ESC ] 8 ; ; url ESC \ text ESC ] 8 ; ; ESC \ .
std::string osc8(const std::string& url, const std::string& text);

// Whether `mode` resolves to a clickable link. Auto follows the terminal
// capability signal and falls back to plain when there is none.
bool enabled(HyperlinkMode mode, std::optional<bool> terminal_supports);

// "text: url" or the OSC 8 form, per `mode`. Pure; never probes the terminal.
std::string present(HyperlinkMode mode, const std::string& url,
                    const std::string& display_text,
                    std::optional<bool> terminal_supports = std::nullopt);

} // namespace hyperlink
