#include "platform.hpp"
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace platform {

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec || p.empty()) return fs::path(".");
    return p;
}

Result<std::string> read_text_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::FileReadFailed,
                                        fmt::format("Cannot open {}", path.string()),
                                        path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Result<std::string>::Err(ErrorKind::FileReadFailed,
                                        fmt::format("Failed to read {}", path.string()),
                                        path.string());
    }
    return Result<std::string>::Ok(ss.str());
}

} // namespace platform
