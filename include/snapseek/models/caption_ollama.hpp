#pragma once

#include "snapseek/models/caption_engine.hpp"

namespace snapseek::models {

class OllamaCaptionEngine final : public ICaptionEngine {
public:
  OllamaCaptionEngine(config::CaptionConfig config, std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override { return "ollama"; }
  [[nodiscard]] common::Result<std::string> caption(std::string_view image_bytes) override;
  [[nodiscard]] bool thread_safe() const override { return config_.thread_safe; }

private:
  config::CaptionConfig config_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace snapseek::models
