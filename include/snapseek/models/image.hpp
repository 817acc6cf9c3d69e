#pragma once

#include "snapseek/common/result.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <string_view>

namespace snapseek::models {

/// Decodes encoded image bytes into an 8-bit, 3-channel BGR matrix. Grayscale,
/// palette and alpha images are coerced. Fails with InvalidImage.
[[nodiscard]] common::Result<cv::Mat> decode_image(std::string_view bytes);

/// Re-encodes a decoded image as JPEG.
[[nodiscard]] common::Result<std::string> encode_jpeg(const cv::Mat &image, int quality = 90);

[[nodiscard]] std::string base64_encode(std::string_view bytes);

} // namespace snapseek::models
