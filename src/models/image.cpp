#include "snapseek/models/image.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <openssl/evp.h>

#include <vector>

namespace snapseek::models {

common::Result<cv::Mat> decode_image(const std::string_view bytes) {
  if (bytes.empty()) {
    return common::Result<cv::Mat>::failure(common::ErrorKind::InvalidImage, "image is empty");
  }

  const cv::Mat buffer(1, static_cast<int>(bytes.size()), CV_8UC1,
                       const_cast<char *>(bytes.data()));
  cv::Mat image;
  try {
    image = cv::imdecode(buffer, cv::IMREAD_COLOR);
  } catch (const cv::Exception &e) {
    return common::Result<cv::Mat>::failure(common::ErrorKind::InvalidImage,
                                            std::string("image decode failed: ") + e.what());
  }

  if (image.empty() || image.cols <= 0 || image.rows <= 0) {
    return common::Result<cv::Mat>::failure(common::ErrorKind::InvalidImage,
                                            "bytes are not a decodable image");
  }

  if (image.channels() == 1) {
    cv::Mat color;
    cv::cvtColor(image, color, cv::COLOR_GRAY2BGR);
    image = color;
  } else if (image.channels() == 4) {
    cv::Mat color;
    cv::cvtColor(image, color, cv::COLOR_BGRA2BGR);
    image = color;
  }

  if (image.channels() != 3 || image.depth() != CV_8U) {
    return common::Result<cv::Mat>::failure(common::ErrorKind::InvalidImage,
                                            "unsupported color mode");
  }
  return common::Result<cv::Mat>::success(std::move(image));
}

common::Result<std::string> encode_jpeg(const cv::Mat &image, const int quality) {
  std::vector<unsigned char> out;
  const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
  try {
    if (!cv::imencode(".jpg", image, out, params)) {
      return common::Result<std::string>::failure(common::ErrorKind::InvalidImage,
                                                  "jpeg encode failed");
    }
  } catch (const cv::Exception &e) {
    return common::Result<std::string>::failure(common::ErrorKind::InvalidImage,
                                                std::string("jpeg encode failed: ") + e.what());
  }
  return common::Result<std::string>::success(std::string(out.begin(), out.end()));
}

std::string base64_encode(const std::string_view bytes) {
  const int output_len = 4 * static_cast<int>((bytes.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()),
                  reinterpret_cast<const unsigned char *>(bytes.data()),
                  static_cast<int>(bytes.size()));
  return output;
}

} // namespace snapseek::models
