#include "snapseek/models/model_service.hpp"

#include "snapseek/observability/global.hpp"

#include <chrono>
#include <stdexcept>

namespace snapseek::models {

namespace {

std::chrono::milliseconds since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

ModelService::ModelService(std::unique_ptr<ICaptionEngine> caption_engine,
                           std::unique_ptr<IEmbedder> embedder)
    : caption_engine_(std::move(caption_engine)), embedder_(std::move(embedder)) {
  if (caption_engine_ == nullptr || embedder_ == nullptr) {
    throw std::invalid_argument("ModelService requires a caption engine and an embedder");
  }
}

common::Result<std::unique_ptr<ModelService>>
ModelService::create(const config::Config &config, std::shared_ptr<HttpClient> http_client) {
  using ServiceResult = common::Result<std::unique_ptr<ModelService>>;

  auto caption_engine = create_caption_engine(config, http_client);
  if (!caption_engine.ok()) {
    return ServiceResult::failure(caption_engine.kind(), caption_engine.error());
  }
  auto embedder = create_embedder(config, http_client);
  if (!embedder.ok()) {
    return ServiceResult::failure(embedder.kind(), embedder.error());
  }
  return ServiceResult::success(std::make_unique<ModelService>(std::move(caption_engine.value()),
                                                               std::move(embedder.value())));
}

common::Result<std::string> ModelService::caption(const std::string_view image_bytes) {
  std::unique_lock<std::mutex> lock(caption_mutex_, std::defer_lock);
  if (!caption_engine_->thread_safe()) {
    lock.lock();
  }

  const auto start = std::chrono::steady_clock::now();
  auto result = caption_engine_->caption(image_bytes);
  observability::record_inference(std::string(caption_engine_->name()), "caption", since(start));

  if (!result.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure, result.error());
  }
  if (result.value().empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure,
                                                std::string(caption_engine_->name()) +
                                                    ": empty caption");
  }
  return result;
}

common::Result<std::vector<float>> ModelService::embed(const std::string_view text) {
  std::unique_lock<std::mutex> lock(embed_mutex_, std::defer_lock);
  if (!embedder_->thread_safe()) {
    lock.lock();
  }

  const auto start = std::chrono::steady_clock::now();
  auto result = embedder_->embed(text);
  observability::record_inference(std::string(embedder_->name()), "embed", since(start));

  return check_dimensions(std::move(result), embedder_->dimensions(), embedder_->name());
}

std::string ModelService::describe() const {
  return "caption=" + std::string(caption_engine_->name()) +
         " embedding=" + std::string(embedder_->name()) + " dimensions=" +
         std::to_string(embedder_->dimensions());
}

} // namespace snapseek::models
