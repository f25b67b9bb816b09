#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace slngen {

// Read a whole file. Returns std::nullopt if it cannot be opened.
std::optional<std::string> read_file(const std::filesystem::path& path);

// Write content through a temporary sibling and rename it into place.
// Creates missing parent directories. Throws GeneratorError on failure.
void write_file(const std::filesystem::path& path, const std::string& content);

// Write only when the bytes differ from what is on disk.
// Returns true if the file was written.
bool write_file_if_changed(const std::filesystem::path& path, const std::string& content);

std::optional<std::filesystem::file_time_type> modification_time(const std::filesystem::path& path);

// realpath(); falls back to an absolute, normalized path when resolution fails
std::string resolve_real_path(const std::string& path);

// Join a relative "/"-separated path onto a root
std::filesystem::path join_path(const std::string& root, const std::string& relative);

std::string replace_all(std::string str, const std::string& from, const std::string& to);

std::string join_strings(const std::vector<std::string>& values, const std::string& separator);

std::vector<std::string> split_lines(const std::string& content);

std::string trim(const std::string& str);

} // namespace slngen
