#include "snapseek/models/caption_ollama.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/common/json_util.hpp"

#include <sstream>

namespace snapseek::models {

namespace {
constexpr const char *kDefaultBaseUrl = "http://localhost:11434";
}

OllamaCaptionEngine::OllamaCaptionEngine(config::CaptionConfig config,
                                         std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {
  if (config_.base_url.empty()) {
    config_.base_url = kDefaultBaseUrl;
  }
}

common::Result<std::string> OllamaCaptionEngine::caption(const std::string_view image_bytes) {
  auto payload = prepare_image_payload(image_bytes);
  if (!payload.ok()) {
    return payload;
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"prompt\":\"" << common::json_escape(config_.prompt) << "\",";
  body << "\"images\":[\"" << payload.value() << "\"],";
  body << "\"stream\":false";
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  const auto response = http_client_->post_json(join_url(config_.base_url, "/api/generate"),
                                                headers, body.str(), config_.timeout_ms);
  if (const auto status = check_response(response, name()); !status.ok()) {
    return common::Result<std::string>::failure(status.kind(), status.error());
  }

  const std::string text = common::trim(common::json_get_string(response.body, "response"));
  if (text.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure,
                                                "ollama: empty caption");
  }
  return common::Result<std::string>::success(text);
}

} // namespace snapseek::models
