#include "issue_template.hpp"
#include <util/string_utils.hpp>

IssueTemplate::IssueTemplate(std::string title, std::string body,
                             std::vector<std::string> labels)
    : title(std::move(title)), body(std::move(body)), labels(std::move(labels)) {}

TemplateFile::TemplateFile(std::string content, std::vector<std::string> labels)
    : content(std::move(content)), labels(std::move(labels)) {}

Result<IssueTemplate> TemplateFile::parse() const {
    auto all = StringUtils::lines(content);
    if (all.empty()) {
        return Result<IssueTemplate>::Err(ErrorKind::InvalidTemplateFile,
                                          "Template file is empty");
    }

    std::string title = StringUtils::trim(all[0]);
    if (title.empty()) {
        return Result<IssueTemplate>::Err(ErrorKind::InvalidTemplateFile,
                                          "Template must have a title on the first line");
    }

    std::vector<std::string> rest(all.begin() + 1, all.end());
    std::string body = StringUtils::trim(StringUtils::join(rest, '\n'));

    return Result<IssueTemplate>::Ok(IssueTemplate(title, body, labels));
}
