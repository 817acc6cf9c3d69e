#include "snapseek/models/embedder_local.hpp"

#include <cctype>
#include <cmath>

namespace snapseek::models {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;
constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

void add_feature(std::vector<float> &values, const std::string &feature, const float weight) {
  const std::uint64_t hash = fnv1a_64(feature);
  const std::size_t idx = static_cast<std::size_t>(hash % values.size());
  const float sign = ((hash >> 63U) & 1U) != 0U ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm == 0.0) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

std::uint64_t fnv1a_64(const std::string_view text) {
  std::uint64_t hash = kFnvOffset;
  for (const char ch : text) {
    hash ^= static_cast<unsigned char>(ch);
    hash *= kFnvPrime;
  }
  return hash;
}

std::vector<std::string> tokenize_words(const std::string_view text) {
  std::vector<std::string> words;
  std::string current;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0) {
      current.push_back(static_cast<char>(std::tolower(uch)));
    } else if (!current.empty()) {
      words.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    words.push_back(std::move(current));
  }
  return words;
}

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 1 : dimensions) {}

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  for (const auto &word : tokenize_words(text)) {
    add_feature(values, "w:" + word, kWordWeight);
    const std::string padded = " " + word + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, "t:" + padded.substr(i, 3), kTrigramWeight);
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace snapseek::models
