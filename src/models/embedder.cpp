#include "snapseek/models/embedder.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/models/embedder_local.hpp"
#include "snapseek/models/embedder_ollama.hpp"
#include "snapseek/models/embedder_openai.hpp"

#include <cmath>

namespace snapseek::models {

common::Result<std::vector<float>> check_dimensions(common::Result<std::vector<float>> vector,
                                                    const std::size_t expected,
                                                    const std::string_view backend) {
  if (!vector.ok()) {
    return common::Result<std::vector<float>>::failure(common::ErrorKind::ModelFailure,
                                                       vector.error());
  }
  if (vector.value().size() != expected) {
    return common::Result<std::vector<float>>::failure(
        common::ErrorKind::ModelFailure,
        std::string(backend) + ": embedding has " + std::to_string(vector.value().size()) +
            " dimensions, expected " + std::to_string(expected));
  }
  for (const float component : vector.value()) {
    if (!std::isfinite(component)) {
      return common::Result<std::vector<float>>::failure(
          common::ErrorKind::ModelFailure, std::string(backend) + ": embedding is not finite");
    }
  }
  return vector;
}

common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config, std::shared_ptr<HttpClient> http_client) {
  using EmbedderResult = common::Result<std::unique_ptr<IEmbedder>>;
  const std::string provider = common::to_lower(common::trim(config.embedding.provider));

  if (config.embedding.dimensions == 0) {
    return EmbedderResult::failure(common::ErrorKind::Configuration,
                                   "embedding.dimensions must be > 0");
  }
  if (provider == "local") {
    return EmbedderResult::success(std::make_unique<LocalEmbedder>(config.embedding.dimensions));
  }
  if (http_client == nullptr) {
    http_client = std::make_shared<CurlHttpClient>();
  }
  if (provider == "ollama") {
    return EmbedderResult::success(
        std::make_unique<OllamaEmbedder>(config.embedding, std::move(http_client)));
  }
  if (provider == "openai") {
    return EmbedderResult::success(std::make_unique<OpenAiEmbedder>(
        config.embedding, config.api_key.value_or(""), std::move(http_client)));
  }
  return EmbedderResult::failure(common::ErrorKind::Configuration,
                                 "unknown embedding provider: " + provider);
}

} // namespace snapseek::models
