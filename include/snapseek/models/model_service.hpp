#pragma once

#include "snapseek/models/caption_engine.hpp"
#include "snapseek/models/embedder.hpp"

#include <memory>
#include <mutex>

namespace snapseek::models {

/// Owns the caption and embedding backends for the lifetime of the process.
/// A backend that does not report thread_safe() is a single-slot resource:
/// concurrent callers take turns on its mutex.
class ModelService {
public:
  ModelService(std::unique_ptr<ICaptionEngine> caption_engine,
               std::unique_ptr<IEmbedder> embedder);

  [[nodiscard]] static common::Result<std::unique_ptr<ModelService>>
  create(const config::Config &config, std::shared_ptr<HttpClient> http_client = nullptr);

  ModelService(const ModelService &) = delete;
  ModelService &operator=(const ModelService &) = delete;

  [[nodiscard]] common::Result<std::string> caption(std::string_view image_bytes);
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text);

  [[nodiscard]] std::size_t dimensions() const { return embedder_->dimensions(); }
  [[nodiscard]] std::string_view caption_backend() const { return caption_engine_->name(); }
  [[nodiscard]] std::string_view embedding_backend() const { return embedder_->name(); }
  [[nodiscard]] std::string describe() const;

private:
  std::unique_ptr<ICaptionEngine> caption_engine_;
  std::unique_ptr<IEmbedder> embedder_;
  std::mutex caption_mutex_;
  std::mutex embed_mutex_;
};

} // namespace snapseek::models
