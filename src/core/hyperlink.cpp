#include "hyperlink.hpp"

namespace hyperlink {

std::string osc8(const std::string& url, const std::string& text) {
    return "\033]8;;" + url + "\033\\" + text + "\033]8;;\033\\";
}

bool enabled(HyperlinkMode mode, std::optional<bool> terminal_supports) {
    switch (mode) {
        case HyperlinkMode::Always: return true;
        case HyperlinkMode::Never:  return false;
        case HyperlinkMode::Auto:   return terminal_supports.value_or(false);
    }
    return false;
}

std::string present(HyperlinkMode mode, const std::string& url,
                    const std::string& display_text,
                    std::optional<bool> terminal_supports) {
    if (enabled(mode, terminal_supports)) {
        return osc8(url, display_text);
    }
    return display_text + ": " + url;
}

} // namespace hyperlink
