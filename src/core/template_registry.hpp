#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include "types.hpp"
#include "issue_template.hpp"

// Template name -> IssueTemplate. Names are unique; the first registration wins.
class TemplateRegistry {
public:
    // Fails with DuplicateTemplateName if `name` is already registered;
    // the existing entry is left untouched.
    Result<void> add(const std::string& name, IssueTemplate tmpl);

    // Returns nullptr if template name is unknown.
    const IssueTemplate* find(const std::string& name) const;

    bool contains(const std::string& name) const { return find(name) != nullptr; }
    size_t size() const { return templates_.size(); }
    bool empty() const { return templates_.empty(); }

    // Registered names, sorted.
    std::vector<std::string> names() const;

private:
    std::unordered_map<std::string, IssueTemplate> templates_;
};
