#pragma once

#include "snapseek/common/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace snapseek::models {

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  std::unordered_map<std::string, std::string> headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;
};

/// Maps transport errors and non-2xx answers to ModelFailure.
[[nodiscard]] common::Status check_response(const HttpResponse &response,
                                            std::string_view backend);

[[nodiscard]] std::string join_url(const std::string &base_url, std::string_view path);

} // namespace snapseek::models
