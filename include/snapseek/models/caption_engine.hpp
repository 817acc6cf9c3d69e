#pragma once

#include "snapseek/common/result.hpp"
#include "snapseek/config/schema.hpp"
#include "snapseek/models/http_client.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace snapseek::models {

/// Produces a short natural-language description of an encoded image.
/// Failures are reported as ModelFailure, including bytes the backend cannot
/// decode. A successful caption is never empty.
class ICaptionEngine {
public:
  virtual ~ICaptionEngine() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::string> caption(std::string_view image_bytes) = 0;
  /// True when concurrent caption() calls on one instance are safe.
  [[nodiscard]] virtual bool thread_safe() const { return false; }
};

/// Decode, coerce to 3-channel and re-encode as base64 JPEG for remote backends.
[[nodiscard]] common::Result<std::string> prepare_image_payload(std::string_view image_bytes);

[[nodiscard]] common::Result<std::unique_ptr<ICaptionEngine>>
create_caption_engine(const config::Config &config, std::shared_ptr<HttpClient> http_client);

} // namespace snapseek::models
