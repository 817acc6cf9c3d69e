#pragma once

#include "snapseek/common/result.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace snapseek::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_list(const std::string &value, char separator = ',');
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Lower-cased text after the last '.', empty when the name has no extension.
[[nodiscard]] std::string file_extension(const std::string &filename);

/// Replace every character outside [A-Za-z0-9_.-] with '_'.
[[nodiscard]] std::string sanitize_filename(const std::string &filename);

[[nodiscard]] Result<std::string> read_file_bytes(const std::filesystem::path &path);

} // namespace snapseek::common
