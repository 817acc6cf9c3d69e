#include "snapseek/models/embedder_ollama.hpp"

#include "snapseek/common/json_util.hpp"

#include <sstream>

namespace snapseek::models {

namespace {
constexpr const char *kDefaultBaseUrl = "http://localhost:11434";
}

OllamaEmbedder::OllamaEmbedder(config::EmbeddingConfig config,
                               std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {
  if (config_.base_url.empty()) {
    config_.base_url = kDefaultBaseUrl;
  }
}

common::Result<std::vector<float>> OllamaEmbedder::embed(const std::string_view text) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"prompt\":\"" << common::json_escape(std::string(text)) << "\"";
  body << "}";

  const std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  const auto response = http_client_->post_json(join_url(config_.base_url, "/api/embeddings"),
                                                headers, body.str(), config_.timeout_ms);
  if (const auto status = check_response(response, name()); !status.ok()) {
    return common::Result<std::vector<float>>::failure(status.kind(), status.error());
  }

  const std::string array = common::json_get_array(response.body, "embedding");
  if (array.empty()) {
    return common::Result<std::vector<float>>::failure(common::ErrorKind::ModelFailure,
                                                       "ollama: embedding field missing");
  }
  return check_dimensions(common::json_parse_float_array(array), config_.dimensions, name());
}

} // namespace snapseek::models
