#include "template_loader.hpp"
#include "platform.hpp"
#include <fmt/format.h>

namespace platform {

Result<TemplateFile> load_template_file(const std::filesystem::path& path,
                                        std::vector<std::string> labels) {
    auto text = read_text_file(path);
    if (text.is_err()) {
        return Result<TemplateFile>::Err(text);
    }

    TemplateFile file(std::move(text.value), std::move(labels));

    // Reject unusable content here so the error names the file on disk
    auto parsed = file.parse();
    if (parsed.is_err()) {
        return Result<TemplateFile>::Err(ErrorKind::InvalidTemplateFile,
                                         fmt::format("{}: {}", path.string(), parsed.error),
                                         path.string());
    }
    return Result<TemplateFile>::Ok(std::move(file));
}

} // namespace platform
