#pragma once

#include "snapseek/codec/vector_codec.hpp"
#include "snapseek/common/result.hpp"
#include "snapseek/models/model_service.hpp"
#include "snapseek/ranking/similarity_ranker.hpp"
#include "snapseek/storage/record_store.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace snapseek::pipeline {

struct SearchRequest {
  std::string query;
  std::size_t limit = 3;
  double threshold = 0.0;
};

struct SearchHit {
  std::int64_t id = 0;
  std::string filename;
  std::string original_filename;
  std::string caption;
  std::string created_at;
  std::uint64_t size_bytes = 0;
  std::string content_type;
  /// Cosine similarity rounded to four decimals.
  double score = 0.0;
};

struct SearchResponse {
  std::string query;
  /// Number of entries in `results`, i.e. after the limit is applied.
  std::size_t total_results = 0;
  std::vector<SearchHit> results;
};

/// QueryReceived -> Embedded -> Scored -> Ranked -> Returned.
///
/// Scores a point-in-time snapshot of the store. A record whose vector blob
/// fails to decode is logged and skipped; it never fails the whole query.
class RetrievalPipeline {
public:
  RetrievalPipeline(models::ModelService &models, storage::IRecordStore &records,
                    const codec::VectorCodec &codec, const ranking::ISimilarityRanker &ranker,
                    std::size_t max_limit);

  [[nodiscard]] common::Result<SearchResponse> search(const SearchRequest &request);

  [[nodiscard]] common::Status validate(const SearchRequest &request) const;

private:
  models::ModelService &models_;
  storage::IRecordStore &records_;
  const codec::VectorCodec &codec_;
  const ranking::ISimilarityRanker &ranker_;
  std::size_t max_limit_;
};

[[nodiscard]] double round_score(double score);

} // namespace snapseek::pipeline
