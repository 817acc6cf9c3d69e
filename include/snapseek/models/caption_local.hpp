#pragma once

#include "snapseek/models/caption_engine.hpp"

namespace snapseek::models {

/// Offline captioner built from simple image statistics: dominant named color,
/// brightness, texture and frame shape.
class LocalCaptionEngine final : public ICaptionEngine {
public:
  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] common::Result<std::string> caption(std::string_view image_bytes) override;
  [[nodiscard]] bool thread_safe() const override { return true; }
};

[[nodiscard]] std::string nearest_color_name(double red, double green, double blue);

} // namespace snapseek::models
