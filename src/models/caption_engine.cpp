#include "snapseek/models/caption_engine.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/models/caption_local.hpp"
#include "snapseek/models/caption_ollama.hpp"
#include "snapseek/models/caption_openai.hpp"
#include "snapseek/models/image.hpp"

namespace snapseek::models {

common::Result<std::string> prepare_image_payload(const std::string_view image_bytes) {
  auto decoded = decode_image(image_bytes);
  if (!decoded.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure, decoded.error());
  }
  auto jpeg = encode_jpeg(decoded.value());
  if (!jpeg.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure, jpeg.error());
  }
  return common::Result<std::string>::success(base64_encode(jpeg.value()));
}

common::Result<std::unique_ptr<ICaptionEngine>>
create_caption_engine(const config::Config &config, std::shared_ptr<HttpClient> http_client) {
  using EngineResult = common::Result<std::unique_ptr<ICaptionEngine>>;
  const std::string provider = common::to_lower(common::trim(config.caption.provider));

  if (provider == "local") {
    return EngineResult::success(std::make_unique<LocalCaptionEngine>());
  }
  if (http_client == nullptr) {
    http_client = std::make_shared<CurlHttpClient>();
  }
  if (provider == "ollama") {
    return EngineResult::success(
        std::make_unique<OllamaCaptionEngine>(config.caption, std::move(http_client)));
  }
  if (provider == "openai") {
    return EngineResult::success(std::make_unique<OpenAiCaptionEngine>(
        config.caption, config.api_key.value_or(""), std::move(http_client)));
  }
  return EngineResult::failure(common::ErrorKind::Configuration,
                               "unknown caption provider: " + provider);
}

} // namespace snapseek::models
