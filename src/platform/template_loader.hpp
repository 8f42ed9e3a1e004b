#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/issue_template.hpp>

namespace platform {

// Read a markdown template from disk. First line is the title,
// the rest is the body. Fails with FileReadFailed or InvalidTemplateFile.
Result<TemplateFile> load_template_file(const std::filesystem::path& path,
                                        std::vector<std::string> labels = {});

} // namespace platform
