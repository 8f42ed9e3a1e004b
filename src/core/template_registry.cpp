#include "template_registry.hpp"
#include <fmt/format.h>
#include <algorithm>

Result<void> TemplateRegistry::add(const std::string& name, IssueTemplate tmpl) {
    auto inserted = templates_.emplace(name, std::move(tmpl));
    if (!inserted.second) {
        return Result<void>::Err(ErrorKind::DuplicateTemplateName,
                                 fmt::format("Template '{}' is already registered", name),
                                 name);
    }
    return Result<void>::Ok();
}

const IssueTemplate* TemplateRegistry::find(const std::string& name) const {
    auto it = templates_.find(name);
    if (it == templates_.end()) return nullptr;
    return &it->second;
}

std::vector<std::string> TemplateRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(templates_.size());
    for (auto& [name, _] : templates_) {
        out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}
