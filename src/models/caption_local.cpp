#include "snapseek/models/caption_local.hpp"

#include "snapseek/models/image.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <array>
#include <limits>

namespace snapseek::models {

namespace {

struct NamedColor {
  const char *name;
  double red;
  double green;
  double blue;
};

constexpr std::array<NamedColor, 12> kPalette = {{
    {"black", 0, 0, 0},
    {"white", 255, 255, 255},
    {"gray", 128, 128, 128},
    {"red", 255, 0, 0},
    {"orange", 255, 140, 0},
    {"yellow", 255, 255, 0},
    {"green", 0, 160, 0},
    {"teal", 0, 128, 128},
    {"blue", 0, 0, 255},
    {"purple", 128, 0, 160},
    {"pink", 255, 150, 200},
    {"brown", 140, 80, 30},
}};

constexpr double kDarkValue = 80.0;
constexpr double kBrightLuma = 210.0;
constexpr double kTexturedStddev = 40.0;
constexpr double kSquareTolerance = 1.15;

std::string shape_word(const int width, const int height) {
  const double ratio = static_cast<double>(width) / static_cast<double>(height);
  if (ratio > kSquareTolerance) {
    return "wide";
  }
  if (ratio < 1.0 / kSquareTolerance) {
    return "tall";
  }
  return "square";
}

} // namespace

std::string nearest_color_name(const double red, const double green, const double blue) {
  const NamedColor *best = &kPalette.front();
  double best_distance = std::numeric_limits<double>::max();
  for (const auto &candidate : kPalette) {
    const double dr = red - candidate.red;
    const double dg = green - candidate.green;
    const double db = blue - candidate.blue;
    const double distance = dr * dr + dg * dg + db * db;
    if (distance < best_distance) {
      best_distance = distance;
      best = &candidate;
    }
  }
  return best->name;
}

common::Result<std::string> LocalCaptionEngine::caption(const std::string_view image_bytes) {
  auto decoded = decode_image(image_bytes);
  if (!decoded.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::ModelFailure,
                                                "local: " + decoded.error());
  }
  const cv::Mat &image = decoded.value();

  cv::Scalar mean;
  cv::Scalar stddev;
  cv::meanStdDev(image, mean, stddev);

  // OpenCV stores channels as BGR.
  const double blue = mean[0];
  const double green = mean[1];
  const double red = mean[2];
  const double luma = 0.299 * red + 0.587 * green + 0.114 * blue;
  const double value = std::max({red, green, blue});
  const double spread = (stddev[0] + stddev[1] + stddev[2]) / 3.0;

  const std::string color = nearest_color_name(red, green, blue);
  std::string tone;
  if (value < kDarkValue && color != "black") {
    tone = "dark ";
  } else if (luma > kBrightLuma && color != "white" && color != "yellow") {
    tone = "bright ";
  }

  const std::string shape = shape_word(image.cols, image.rows);
  if (spread > kTexturedStddev) {
    return common::Result<std::string>::success("a textured " + shape + " image, mostly " + tone +
                                                color);
  }
  return common::Result<std::string>::success("a " + tone + color + " " + shape + " image");
}

} // namespace snapseek::models
