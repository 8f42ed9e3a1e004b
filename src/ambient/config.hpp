#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/report_handle.hpp>

namespace fs = std::filesystem;

// One entry under `templates:` in bugrep.yaml
struct TemplateEntry {
    std::string name;
    std::string title;
    std::string body;
    fs::path file;                       // set instead of title/body; resolved against the config dir
    std::vector<std::string> labels;     // string or list in YAML
};

class Config {
public:
    Config() = default;

    // Load a YAML report configuration. YAML errors become InvalidConfig.
    static Result<Config> load(const fs::path& path);

    // Accessors
    const std::string& owner() const { return owner_; }
    const std::string& repo() const { return repo_; }
    HyperlinkMode hyperlinks() const { return hyperlinks_; }
    const std::vector<TemplateEntry>& templates() const { return templates_; }
    const fs::path& path() const { return path_; }

    void set_hyperlinks(HyperlinkMode mode) { hyperlinks_ = mode; }

    // Register every entry (reading template files from disk) and build.
    Result<ReportHandle> make_handle() const;

private:
    std::string owner_;
    std::string repo_;
    HyperlinkMode hyperlinks_ = HyperlinkMode::Auto;
    std::vector<TemplateEntry> templates_;
    fs::path path_;
};

// $BUGREP_CONFIG if set, else ./bugrep.yaml
fs::path default_config_path();
