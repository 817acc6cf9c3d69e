#include "snapseek/models/embedder_openai.hpp"

#include "snapseek/common/json_util.hpp"

#include <sstream>

namespace snapseek::models {

namespace {
constexpr const char *kDefaultBaseUrl = "https://api.openai.com/v1";
}

OpenAiEmbedder::OpenAiEmbedder(config::EmbeddingConfig config, std::string api_key,
                               std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), api_key_(std::move(api_key)),
      http_client_(std::move(http_client)) {
  if (config_.base_url.empty()) {
    config_.base_url = kDefaultBaseUrl;
  }
}

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  if (api_key_.empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorKind::ModelFailure,
                                                       "openai: missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"input\":\"" << common::json_escape(std::string(text)) << "\"";
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };
  const auto response = http_client_->post_json(join_url(config_.base_url, "/embeddings"),
                                                headers, body.str(), config_.timeout_ms);
  if (const auto status = check_response(response, name()); !status.ok()) {
    return common::Result<std::vector<float>>::failure(status.kind(), status.error());
  }

  const auto data = common::json_split_top_level_objects(common::json_get_array(response.body, "data"));
  if (data.empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorKind::ModelFailure,
                                                       "openai: response has no data");
  }
  const std::string array = common::json_get_array(data.front(), "embedding");
  if (array.empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorKind::ModelFailure,
                                                       "openai: embedding field missing");
  }
  return check_dimensions(common::json_parse_float_array(array), config_.dimensions, name());
}

} // namespace snapseek::models
