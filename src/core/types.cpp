#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                  return "None";
        case ErrorKind::DuplicateTemplateName: return "DuplicateTemplateName";
        case ErrorKind::EmptyOwnerOrRepo:      return "EmptyOwnerOrRepo";
        case ErrorKind::AlreadyInitialized:    return "AlreadyInitialized";
        case ErrorKind::NotInitialized:        return "NotInitialized";
        case ErrorKind::UnknownTemplate:       return "UnknownTemplate";
        case ErrorKind::MissingParameter:      return "MissingParameter";
        case ErrorKind::InvalidTemplateFile:   return "InvalidTemplateFile";
        case ErrorKind::FileReadFailed:        return "FileReadFailed";
        case ErrorKind::InvalidConfig:         return "InvalidConfig";
    }
    return "Unknown";
}

const char* hyperlink_mode_name(HyperlinkMode mode) {
    switch (mode) {
        case HyperlinkMode::Auto:   return "auto";
        case HyperlinkMode::Always: return "always";
        case HyperlinkMode::Never:  return "never";
    }
    return "auto";
}

std::optional<HyperlinkMode> parse_hyperlink_mode(const std::string& s) {
    if (s == "auto") return HyperlinkMode::Auto;
    if (s == "always") return HyperlinkMode::Always;
    if (s == "never") return HyperlinkMode::Never;
    return std::nullopt;
}

// ── ParameterMap ────────────────────────────────────────────────

ParameterMap::ParameterMap(std::initializer_list<Param> entries) {
    for (const auto& e : entries) {
        set(e.key, e.value);
    }
}

ParameterMap& ParameterMap::set(const std::string& key, const std::string& value) {
    for (auto& e : entries_) {
        if (e.first == key) {
            e.second = value;
            return *this;
        }
    }
    entries_.emplace_back(key, value);
    return *this;
}

const std::string* ParameterMap::find(const std::string& key) const {
    for (const auto& e : entries_) {
        if (e.first == key) return &e.second;
    }
    return nullptr;
}
