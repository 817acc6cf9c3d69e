#pragma once

#include "snapseek/common/result.hpp"
#include "snapseek/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapseek::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] std::filesystem::path resolve_upload_dir(const Config &config);
[[nodiscard]] std::filesystem::path resolve_database_path(const Config &config);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_content);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] bool is_known_caption_provider(const std::string &provider);
[[nodiscard]] bool is_known_embedding_provider(const std::string &provider);

} // namespace snapseek::config
