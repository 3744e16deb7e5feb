#pragma once

#include "edgexfer/core/result.hpp"

#include <filesystem>
#include <string>

namespace edgexfer::core {

Result<void> ensure_parent_exists(const std::filesystem::path& path);

/// Writes to a sibling temporary file and renames it over `path`, so readers
/// observe either the old or the new content.
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& content);

Result<std::string> read_file(const std::filesystem::path& path);

} // namespace edgexfer::core
