#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// Whole file as text. Fails with FileReadFailed if it can't be opened or read.
Result<std::string> read_text_file(const std::filesystem::path& path);

} // namespace platform
