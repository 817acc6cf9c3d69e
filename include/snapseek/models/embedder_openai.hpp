#pragma once

#include "snapseek/models/embedder.hpp"

namespace snapseek::models {

class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(config::EmbeddingConfig config, std::string api_key,
                 std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override { return "openai"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return config_.dimensions; }
  [[nodiscard]] bool thread_safe() const override { return config_.thread_safe; }

private:
  config::EmbeddingConfig config_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace snapseek::models
