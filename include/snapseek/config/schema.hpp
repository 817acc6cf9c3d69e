#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snapseek::config {

struct StorageConfig {
  std::string data_dir = "~/.snapseek";
  // Empty means "<data_dir>/uploads" and "<data_dir>/images.db".
  std::string upload_dir;
  std::string database_path;
  std::uint64_t max_file_size = 10'485'760;
  std::vector<std::string> allowed_extensions = {"jpg", "jpeg", "png"};
};

struct CaptionConfig {
  std::string provider = "local";
  std::string model = "llava";
  std::string base_url;
  std::string prompt = "Describe this image in one short sentence.";
  std::uint64_t timeout_ms = 120'000;
  bool thread_safe = false;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "all-minilm";
  std::string base_url;
  std::size_t dimensions = 384;
  std::uint64_t timeout_ms = 30'000;
  bool thread_safe = false;
};

struct SearchConfig {
  std::uint32_t default_limit = 3;
  std::uint32_t max_limit = 20;
  double default_threshold = 0.0;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::optional<std::string> api_key;
  StorageConfig storage;
  CaptionConfig caption;
  EmbeddingConfig embedding;
  SearchConfig search;
  ObservabilityConfig observability;
};

} // namespace snapseek::config
