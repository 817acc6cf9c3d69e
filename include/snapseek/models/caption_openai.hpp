#pragma once

#include "snapseek/models/caption_engine.hpp"

namespace snapseek::models {

/// Chat-completions vision captioner. Works with any OpenAI-compatible server.
class OpenAiCaptionEngine final : public ICaptionEngine {
public:
  OpenAiCaptionEngine(config::CaptionConfig config, std::string api_key,
                      std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override { return "openai"; }
  [[nodiscard]] common::Result<std::string> caption(std::string_view image_bytes) override;
  [[nodiscard]] bool thread_safe() const override { return config_.thread_safe; }

private:
  config::CaptionConfig config_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
};

[[nodiscard]] common::Result<std::string> parse_chat_completion_content(const std::string &body);

} // namespace snapseek::models
