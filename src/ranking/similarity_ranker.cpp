#include "snapseek/ranking/similarity_ranker.hpp"

#include <algorithm>
#include <cmath>

namespace snapseek::ranking {

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;

  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }

  // sqrt(x * x) == x exactly, so identical vectors score exactly 1.0.
  return std::clamp(dot / std::sqrt(norm_a * norm_b), -1.0, 1.0);
}

common::Result<std::vector<ScoredItem>>
LinearScanRanker::rank(const std::vector<float> &query, const std::vector<Candidate> &candidates,
                       const double threshold, const std::size_t limit) const {
  using RankResult = common::Result<std::vector<ScoredItem>>;
  if (limit == 0) {
    return RankResult::failure(common::ErrorKind::Validation, "limit must be >= 1");
  }
  if (std::isnan(threshold)) {
    return RankResult::failure(common::ErrorKind::Validation, "threshold is not a number");
  }

  std::vector<ScoredItem> scored;
  scored.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    if (candidate.vector.size() != query.size()) {
      return RankResult::failure(common::ErrorKind::Validation,
                                 "candidate " + std::to_string(candidate.id) + " has " +
                                     std::to_string(candidate.vector.size()) +
                                     " dimensions, query has " + std::to_string(query.size()));
    }
    const double score = cosine_similarity(query, candidate.vector);
    if (score < threshold) {
      continue;
    }
    scored.push_back(ScoredItem{.id = candidate.id, .score = score});
  }

  std::stable_sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
    return lhs.score > rhs.score;
  });

  if (scored.size() > limit) {
    scored.resize(limit);
  }

  return RankResult::success(std::move(scored));
}

} // namespace snapseek::ranking
