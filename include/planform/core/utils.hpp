#pragma once

#include <filesystem>
#include <string>

namespace planform::core {

namespace fs = std::filesystem;

// UTC, millisecond precision: 2024-05-01T12:00:00.123Z
std::string get_iso_timestamp();
std::string get_run_id();

// Truncates an existing file. Throws IOError.
void write_text(const fs::path& path, const std::string& text);

// Lowercase hex SHA-256 of the file contents. Throws IOError.
std::string sha256_file(const fs::path& path);

std::string to_lower(std::string s);

} // namespace planform::core
