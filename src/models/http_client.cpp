#include "snapseek/models/http_client.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/common/json_util.hpp"

#include <curl/curl.h>

namespace snapseek::models {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  std::string header(buffer, total);
  auto *headers = static_cast<std::unordered_map<std::string, std::string> *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }

  return total;
}

std::string error_detail(const std::string &body) {
  // OpenAI nests the message under "error", Ollama puts a plain string there.
  const std::string nested = common::json_get_object(body, "error");
  if (!nested.empty()) {
    const std::string message = common::json_get_string(nested, "message");
    if (!message.empty()) {
      return message;
    }
  }
  const std::string flat = common::json_get_string(body, "error");
  if (!flat.empty()) {
    return flat;
  }
  constexpr std::size_t kMaxSnippet = 200;
  return body.size() > kMaxSnippet ? body.substr(0, kMaxSnippet) + "..." : body;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url,
                                       const std::unordered_map<std::string, std::string> &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "snapseek/0.1");
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

common::Status check_response(const HttpResponse &response, const std::string_view backend) {
  const std::string prefix = std::string(backend) + ": ";
  if (response.timeout) {
    return common::Status::error(common::ErrorKind::ModelFailure, prefix + "request timed out");
  }
  if (response.network_error) {
    return common::Status::error(common::ErrorKind::ModelFailure,
                                 prefix + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(common::ErrorKind::ModelFailure,
                                 prefix + "HTTP " + std::to_string(response.status) + " " +
                                     error_detail(response.body));
  }
  return common::Status::success();
}

std::string join_url(const std::string &base_url, const std::string_view path) {
  std::string out = base_url;
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  out += path;
  return out;
}

} // namespace snapseek::models
