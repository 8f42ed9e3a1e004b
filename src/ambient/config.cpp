#include "config.hpp"
#include <core/constants.hpp>
#include <platform/debug_log.hpp>
#include <platform/template_loader.hpp>
#include <platform/terminal.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Labels may be a single string or a list of strings
static Result<std::vector<std::string>> parse_labels(const std::string& name,
                                                     const YAML::Node& node) {
    std::vector<std::string> labels;
    if (!node || node.IsNull()) return Result<std::vector<std::string>>::Ok(labels);

    if (node.IsScalar()) {
        labels.push_back(node.as<std::string>());
        return Result<std::vector<std::string>>::Ok(labels);
    }
    if (node.IsSequence()) {
        for (const auto& item : node) {
            if (!item.IsScalar()) {
                return Result<std::vector<std::string>>::Err(
                    ErrorKind::InvalidConfig,
                    fmt::format("Template '{}' has a label that is not a string", name),
                    name);
            }
            labels.push_back(item.as<std::string>());
        }
        return Result<std::vector<std::string>>::Ok(labels);
    }
    return Result<std::vector<std::string>>::Err(
        ErrorKind::InvalidConfig,
        fmt::format("Template '{}' labels must be a string or a list", name),
        name);
}

static Result<TemplateEntry> parse_template_entry(const std::string& name,
                                                  const YAML::Node& node,
                                                  const fs::path& base_dir) {
    TemplateEntry entry;
    entry.name = name;

    if (node.IsScalar()) {
        // Bare string shorthand: `crash: templates/crash.md`
        entry.file = base_dir / node.as<std::string>();
        return Result<TemplateEntry>::Ok(entry);
    }
    if (!node.IsMap()) {
        return Result<TemplateEntry>::Err(ErrorKind::InvalidConfig,
                                          fmt::format("Template '{}' must be a map or a file path", name),
                                          name);
    }

    auto labels = parse_labels(name, node["labels"]);
    if (labels.is_err()) {
        return Result<TemplateEntry>::Err(labels);
    }
    entry.labels = std::move(labels.value);

    if (node["file"]) {
        entry.file = base_dir / node["file"].as<std::string>();
    } else if (node["title"]) {
        entry.title = node["title"].as<std::string>();
        entry.body = node["body"].as<std::string>("");
    } else {
        return Result<TemplateEntry>::Err(ErrorKind::InvalidConfig,
                                          fmt::format("Template '{}' needs either 'file' or 'title'", name),
                                          name);
    }
    return Result<TemplateEntry>::Ok(entry);
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err(ErrorKind::FileReadFailed,
                                   "Report config not found at " + path.string(),
                                   path.string());
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());

        Config config;
        config.path_ = path;
        config.owner_ = root["owner"].as<std::string>("");
        config.repo_ = root["repo"].as<std::string>("");

        std::string mode = root["hyperlinks"].as<std::string>("auto");
        auto parsed_mode = parse_hyperlink_mode(mode);
        if (!parsed_mode) {
            return Result<Config>::Err(ErrorKind::InvalidConfig,
                                       fmt::format("Unknown hyperlinks mode '{}' (expected auto, always or never)", mode));
        }
        config.hyperlinks_ = *parsed_mode;

        if (root["templates"]) {
            if (!root["templates"].IsMap()) {
                return Result<Config>::Err(ErrorKind::InvalidConfig,
                                           "'templates' must be a map of name to template");
            }
            fs::path base_dir = path.parent_path();
            for (const auto& kv : root["templates"]) {
                auto entry = parse_template_entry(kv.first.as<std::string>(), kv.second, base_dir);
                if (entry.is_err()) {
                    return Result<Config>::Err(entry);
                }
                config.templates_.push_back(std::move(entry.value));
            }
        }

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::InvalidConfig,
                                   std::string("Failed to parse report config: ") + e.what(),
                                   path.string());
    }
}

Result<ReportHandle> Config::make_handle() const {
    ReportBuilder builder(owner_, repo_);
    builder.hyperlinks(hyperlinks_);

    for (const auto& entry : templates_) {
        if (!entry.file.empty()) {
            auto file = platform::load_template_file(entry.file, entry.labels);
            if (file.is_err()) {
                bugrep_log_error(fmt::format("load template '{}'", entry.name), file);
                return Result<ReportHandle>::Err(file);
            }
            builder.add_template_file(entry.name, file.value);
        } else {
            builder.add_template(entry.name, IssueTemplate(entry.title, entry.body, entry.labels));
        }
    }

    return builder.build();
}

fs::path default_config_path() {
    if (auto env = platform::env_var(CONFIG_ENV_VAR)) {
        if (!env->empty()) return fs::path(*env);
    }
    return fs::current_path() / DEFAULT_CONFIG_FILE;
}
