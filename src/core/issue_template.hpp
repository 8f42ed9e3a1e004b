#pragma once

#include <string>
#include <vector>
#include "types.hpp"

struct IssueTemplate {
    std::string title;                  // title pattern, e.g. "Crash: {error_type}"
    std::string body;                   // body pattern
    std::vector<std::string> labels;

    IssueTemplate() = default;
    IssueTemplate(std::string title, std::string body,
                  std::vector<std::string> labels = {});
};

// Template whose patterns come from text content (typically a markdown file).
// The first line is the title pattern, the rest is the body pattern.
struct TemplateFile {
    std::string content;
    std::vector<std::string> labels;

    TemplateFile() = default;
    explicit TemplateFile(std::string content, std::vector<std::string> labels = {});

    // Fails with InvalidTemplateFile when the first line is empty or blank.
    Result<IssueTemplate> parse() const;
};
