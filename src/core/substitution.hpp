#pragma once

#include <string>
#include <vector>
#include "types.hpp"
#include "issue_template.hpp"

// A template with every placeholder filled in
struct RenderedIssue {
    std::string title;
    std::string body;
    std::vector<std::string> labels;
};

// Distinct placeholder names in `pattern`, in first-seen order.
// A placeholder is '{' + one or more [A-Za-z0-9_] + '}'; any other brace is text.
std::vector<std::string> placeholders(const std::string& pattern);

// Placeholders of the title and body that have no entry in `params`.
std::vector<std::string> missing_parameters(const IssueTemplate& tmpl,
                                            const ParameterMap& params);

// Fill the title and body patterns of `tmpl` from `params`.
// Every placeholder is checked before anything is substituted; a missing one
// fails with MissingParameter (subject = first missing name). Values are
// inserted verbatim and never re-expanded. Unused parameters are ignored.
Result<RenderedIssue> substitute(const std::string& template_name,
                                 const IssueTemplate& tmpl,
                                 const ParameterMap& params);
