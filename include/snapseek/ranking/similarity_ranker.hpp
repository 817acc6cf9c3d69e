#pragma once

#include "snapseek/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace snapseek::ranking {

struct Candidate {
  std::int64_t id = 0;
  std::vector<float> vector;
};

struct ScoredItem {
  std::int64_t id = 0;
  double score = 0.0;
};

/// Cosine similarity in [-1, 1]. Zero-magnitude or mismatched vectors score 0.0.
[[nodiscard]] double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

/// Scores candidates against a query, drops those below `threshold`, orders the
/// rest by descending score (equal scores keep input order) and truncates to
/// `limit`. Filtering and ordering always see the full candidate set.
class ISimilarityRanker {
public:
  virtual ~ISimilarityRanker() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<ScoredItem>>
  rank(const std::vector<float> &query, const std::vector<Candidate> &candidates, double threshold,
       std::size_t limit) const = 0;
};

class LinearScanRanker final : public ISimilarityRanker {
public:
  [[nodiscard]] std::string_view name() const override { return "linear"; }
  [[nodiscard]] common::Result<std::vector<ScoredItem>>
  rank(const std::vector<float> &query, const std::vector<Candidate> &candidates, double threshold,
       std::size_t limit) const override;
};

} // namespace snapseek::ranking
