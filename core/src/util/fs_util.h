#pragma once

#include <filesystem>
#include <string>

namespace confq::util {

/// Returns "<dir>/.<name>.tmp.<random hex>" beside dest.
std::filesystem::path unique_temp_path(const std::filesystem::path& dest);

/// Writes content to a temp file beside path, then renames it into place.
/// MUST throw std::runtime_error on failure and MUST remove the temp file on failure.
void write_file_atomic(const std::filesystem::path& path, const std::string& content);

/// Reads the whole file; returns false when it cannot be opened.
bool read_file(const std::filesystem::path& path, std::string& out);

/// Regular file with an execute bit for the current user.
bool is_executable_file(const std::filesystem::path& path);

}  // namespace confq::util
