#include "snapseek/config/config.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace snapseek::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".snapseek";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SNAPSEEK_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                            (value.front() == '\'' && value.back() == '\''))) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (!is_valid_env_name(key)) {
      continue;
    }
    // Existing environment wins over .env contents.
    setenv(key.c_str(), strip_env_quotes(trimmed.substr(eq + 1)).c_str(), 0);
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            common::ErrorKind::Configuration, "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.kind(), home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return cfg_dir;
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::filesystem::path resolve_upload_dir(const Config &config) {
  if (!config.storage.upload_dir.empty()) {
    return common::expand_path(config.storage.upload_dir);
  }
  return std::filesystem::path(common::expand_path(config.storage.data_dir)) / "uploads";
}

std::filesystem::path resolve_database_path(const Config &config) {
  if (!config.storage.database_path.empty()) {
    return common::expand_path(config.storage.database_path);
  }
  return std::filesystem::path(common::expand_path(config.storage.data_dir)) / "images.db";
}

bool is_known_caption_provider(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  return normalized == "local" || normalized == "ollama" || normalized == "openai";
}

bool is_known_embedding_provider(const std::string &provider) {
  const std::string normalized = common::to_lower(common::trim(provider));
  return normalized == "local" || normalized == "ollama" || normalized == "openai";
}

void apply_env_overrides(Config &config) {
  if (const char *api_key = env_value("SNAPSEEK_API_KEY"); api_key != nullptr) {
    config.api_key = std::string(api_key);
  }
  if (const char *dir = env_value("SNAPSEEK_UPLOAD_DIR"); dir != nullptr) {
    config.storage.upload_dir = dir;
  }
  if (const char *db = env_value("SNAPSEEK_DATABASE_PATH"); db != nullptr) {
    config.storage.database_path = db;
  }
  if (const char *size = env_value("SNAPSEEK_MAX_FILE_SIZE"); size != nullptr) {
    try {
      config.storage.max_file_size = std::stoull(size);
    } catch (const std::exception &) {
      // Invalid override keeps the configured limit.
    }
  }
  if (const char *exts = env_value("SNAPSEEK_ALLOWED_EXTENSIONS"); exts != nullptr) {
    auto parsed = common::split_list(common::to_lower(exts));
    if (!parsed.empty()) {
      config.storage.allowed_extensions = std::move(parsed);
    }
  }
  if (const char *provider = env_value("SNAPSEEK_CAPTION_PROVIDER"); provider != nullptr) {
    config.caption.provider = provider;
  }
  if (const char *provider = env_value("SNAPSEEK_EMBEDDING_PROVIDER"); provider != nullptr) {
    config.embedding.provider = provider;
  }
}

common::Result<Config> parse_config(const std::string &toml_content) {
  const auto parsed = common::parse_toml(toml_content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.kind(), parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  if (doc.has("api_key")) {
    config.api_key = expand_config_value(doc.get_string("api_key"));
  }

  config.storage.data_dir = doc.get_string("storage.data_dir", config.storage.data_dir);
  config.storage.upload_dir = doc.get_string("storage.upload_dir", config.storage.upload_dir);
  config.storage.database_path =
      doc.get_string("storage.database_path", config.storage.database_path);
  config.storage.max_file_size =
      doc.get_u64("storage.max_file_size", config.storage.max_file_size);
  config.storage.allowed_extensions =
      doc.get_string_array("storage.allowed_extensions", config.storage.allowed_extensions);
  for (auto &ext : config.storage.allowed_extensions) {
    ext = common::to_lower(common::trim(ext));
    if (common::starts_with(ext, ".")) {
      ext.erase(0, 1);
    }
  }

  config.caption.provider = doc.get_string("caption.provider", config.caption.provider);
  config.caption.model = doc.get_string("caption.model", config.caption.model);
  config.caption.base_url = expand_config_value(doc.get_string("caption.base_url"));
  config.caption.prompt = doc.get_string("caption.prompt", config.caption.prompt);
  config.caption.timeout_ms = doc.get_u64("caption.timeout_ms", config.caption.timeout_ms);
  config.caption.thread_safe = doc.get_bool("caption.thread_safe", config.caption.thread_safe);

  config.embedding.provider = doc.get_string("embedding.provider", config.embedding.provider);
  config.embedding.model = doc.get_string("embedding.model", config.embedding.model);
  config.embedding.base_url = expand_config_value(doc.get_string("embedding.base_url"));
  config.embedding.dimensions = static_cast<std::size_t>(
      doc.get_u64("embedding.dimensions", config.embedding.dimensions));
  config.embedding.timeout_ms = doc.get_u64("embedding.timeout_ms", config.embedding.timeout_ms);
  config.embedding.thread_safe =
      doc.get_bool("embedding.thread_safe", config.embedding.thread_safe);

  config.search.default_limit = static_cast<std::uint32_t>(
      doc.get_u64("search.default_limit", config.search.default_limit));
  config.search.max_limit =
      static_cast<std::uint32_t>(doc.get_u64("search.max_limit", config.search.max_limit));
  config.search.default_threshold =
      doc.get_double("search.default_threshold", config.search.default_threshold);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  load_dotenv_files();

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.kind(), cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file_bytes(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Configuration,
                                           "Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  if (config.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.api_key) << "\n\n";
  }

  file << "[storage]\n";
  file << "data_dir = " << common::quote_toml_string(config.storage.data_dir) << "\n";
  file << "upload_dir = " << common::quote_toml_string(config.storage.upload_dir) << "\n";
  file << "database_path = " << common::quote_toml_string(config.storage.database_path) << "\n";
  file << "max_file_size = " << config.storage.max_file_size << "\n";
  file << "allowed_extensions = " << string_array_to_toml(config.storage.allowed_extensions)
       << "\n";

  file << "\n[caption]\n";
  file << "provider = " << common::quote_toml_string(config.caption.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.caption.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.caption.base_url) << "\n";
  file << "prompt = " << common::quote_toml_string(config.caption.prompt) << "\n";
  file << "timeout_ms = " << config.caption.timeout_ms << "\n";
  file << "thread_safe = " << bool_to_toml(config.caption.thread_safe) << "\n";

  file << "\n[embedding]\n";
  file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  file << "dimensions = " << config.embedding.dimensions << "\n";
  file << "timeout_ms = " << config.embedding.timeout_ms << "\n";
  file << "thread_safe = " << bool_to_toml(config.embedding.thread_safe) << "\n";

  file << "\n[search]\n";
  file << "default_limit = " << config.search.default_limit << "\n";
  file << "max_limit = " << config.search.max_limit << "\n";
  file << "default_threshold = " << config.search.default_threshold << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.kind(), cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error(common::ErrorKind::Storage,
                                   "Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error(common::ErrorKind::Storage,
                                 "Unable to write temporary config file");
  }
  file << render_config(config);
  file.close();
  if (!file) {
    return common::Status::error(common::ErrorKind::Storage,
                                 "Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Storage,
                                 "Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (!is_known_caption_provider(config.caption.provider)) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "Unknown caption.provider: " + config.caption.provider);
  }
  if (!is_known_embedding_provider(config.embedding.provider)) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "Unknown embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.dimensions == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "embedding.dimensions must be > 0");
  }
  if (config.storage.max_file_size == 0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "storage.max_file_size must be > 0");
  }
  if (config.storage.allowed_extensions.empty()) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "storage.allowed_extensions must not be empty");
  }
  if (config.search.max_limit < 1) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "search.max_limit must be >= 1");
  }
  if (config.search.default_limit < 1 || config.search.default_limit > config.search.max_limit) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "search.default_limit must be between 1 and search.max_limit");
  }
  if (config.search.default_threshold < 0.0 || config.search.default_threshold > 1.0) {
    return ValidationResult::failure(common::ErrorKind::Configuration,
                                     "search.default_threshold must be between 0.0 and 1.0");
  }

  const bool api_key_missing = !config.api_key.has_value() || common::trim(*config.api_key).empty();
  if (api_key_missing && common::to_lower(config.caption.provider) == "openai") {
    warnings.push_back("caption.provider is openai but no API key is configured");
  }
  if (api_key_missing && common::to_lower(config.embedding.provider) == "openai") {
    warnings.push_back("embedding.provider is openai but no API key is configured");
  }
  if (config.storage.max_file_size > 100ULL * 1024ULL * 1024ULL) {
    warnings.push_back("storage.max_file_size is above 100 MiB");
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace snapseek::config
