#pragma once

#include "snapseek/models/embedder.hpp"

#include <cstdint>

namespace snapseek::models {

/// Deterministic feature-hashing embedder. Lower-cased word tokens and their
/// character trigrams are hashed into signed buckets, then L2-normalized.
/// Text without any alphanumeric token embeds to the zero vector.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }
  [[nodiscard]] bool thread_safe() const override { return true; }

private:
  std::size_t dimensions_;
};

[[nodiscard]] std::uint64_t fnv1a_64(std::string_view text);
[[nodiscard]] std::vector<std::string> tokenize_words(std::string_view text);

} // namespace snapseek::models
