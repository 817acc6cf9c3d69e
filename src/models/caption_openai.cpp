#include "snapseek/models/caption_openai.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/common/json_util.hpp"

#include <sstream>

namespace snapseek::models {

namespace {
constexpr const char *kDefaultBaseUrl = "https://api.openai.com/v1";
constexpr int kMaxCaptionTokens = 100;
} // namespace

common::Result<std::string> parse_chat_completion_content(const std::string &body) {
  const auto choices = common::json_split_top_level_objects(common::json_get_array(body, "choices"));
  if (choices.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure,
                                                "response has no choices");
  }
  const std::string message = common::json_get_object(choices.front(), "message");
  const std::string content = common::trim(common::json_get_string(message, "content"));
  if (content.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure,
                                                "empty caption");
  }
  return common::Result<std::string>::success(content);
}

OpenAiCaptionEngine::OpenAiCaptionEngine(config::CaptionConfig config, std::string api_key,
                                         std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)) {
  if (config_.base_url.empty()) {
    config_.base_url = kDefaultBaseUrl;
  }
}

common::Result<std::string> OpenAiCaptionEngine::caption(const std::string_view image_bytes) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure,
                                                "openai: missing API key");
  }

  auto payload = prepare_image_payload(image_bytes);
  if (!payload.ok()) {
    return payload;
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"max_tokens\":" << kMaxCaptionTokens << ",";
  body << "\"messages\":[{\"role\":\"user\",\"content\":[";
  body << "{\"type\":\"text\",\"text\":\"" << common::json_escape(config_.prompt) << "\"},";
  body << "{\"type\":\"image_url\",\"image_url\":{\"url\":\"data:image/jpeg;base64,"
       << payload.value() << "\"}}";
  body << "]}]";
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };
  const auto response = http_client_->post_json(join_url(config_.base_url, "/chat/completions"),
                                                headers, body.str(), config_.timeout_ms);
  if (const auto status = check_response(response, name()); !status.ok()) {
    return common::Result<std::string>::failure(status.kind(), status.error());
  }

  auto content = parse_chat_completion_content(response.body);
  if (!content.ok()) {
    return common::Result<std::string>::failure(content.kind(), "openai: " + content.error());
  }
  return content;
}

} // namespace snapseek::models
