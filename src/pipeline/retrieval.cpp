#include "snapseek/pipeline/retrieval.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/observability/global.hpp"

#include <chrono>
#include <cmath>
#include <unordered_map>

namespace snapseek::pipeline {

double round_score(const double score) { return std::round(score * 10'000.0) / 10'000.0; }

RetrievalPipeline::RetrievalPipeline(models::ModelService &models, storage::IRecordStore &records,
                                     const codec::VectorCodec &codec,
                                     const ranking::ISimilarityRanker &ranker,
                                     const std::size_t max_limit)
    : models_(models), records_(records), codec_(codec), ranker_(ranker), max_limit_(max_limit) {}

common::Status RetrievalPipeline::validate(const SearchRequest &request) const {
  if (common::trim(request.query).empty()) {
    return common::Status::error(common::ErrorKind::Validation, "query must not be empty");
  }
  if (request.limit < 1 || request.limit > max_limit_) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "limit must be between 1 and " + std::to_string(max_limit_));
  }
  if (!(request.threshold >= 0.0 && request.threshold <= 1.0)) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "threshold must be between 0.0 and 1.0");
  }
  return common::Status::success();
}

common::Result<SearchResponse> RetrievalPipeline::search(const SearchRequest &request) {
  const auto start = std::chrono::steady_clock::now();

  if (auto status = validate(request); !status.ok()) {
    return common::Result<SearchResponse>::failure(status.kind(), status.error());
  }

  auto query_vector = models_.embed(request.query);
  if (!query_vector.ok()) {
    return common::Result<SearchResponse>::failure(query_vector.kind(), query_vector.error());
  }

  auto snapshot = records_.list_all_records();
  if (!snapshot.ok()) {
    return common::Result<SearchResponse>::failure(snapshot.kind(), snapshot.error());
  }

  std::vector<ranking::Candidate> candidates;
  candidates.reserve(snapshot.value().size());
  std::unordered_map<std::int64_t, const storage::StoredItem *> by_id;
  for (const auto &item : snapshot.value()) {
    auto vector = codec_.decode(item.vector_blob);
    if (!vector.ok()) {
      observability::record_item_skipped(item.id, vector.error());
      continue;
    }
    candidates.push_back(ranking::Candidate{.id = item.id, .vector = std::move(vector.value())});
    by_id.emplace(item.id, &item);
  }
  observability::record_metric(observability::CandidateCountMetric{.count = candidates.size()});

  auto ranked = ranker_.rank(query_vector.value(), candidates, request.threshold, request.limit);
  if (!ranked.ok()) {
    return common::Result<SearchResponse>::failure(ranked.kind(), ranked.error());
  }

  SearchResponse response;
  response.query = request.query;
  response.results.reserve(ranked.value().size());
  for (const auto &scored : ranked.value()) {
    const auto *item = by_id.at(scored.id);
    response.results.push_back(SearchHit{
        .id = item->id,
        .filename = item->filename,
        .original_filename = item->original_filename,
        .caption = item->caption,
        .created_at = item->created_at,
        .size_bytes = item->size_bytes,
        .content_type = item->content_type,
        .score = round_score(scored.score),
    });
  }
  response.total_results = response.results.size();

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  observability::record_search_completed(request.query, candidates.size(),
                                         response.total_results, duration);
  return common::Result<SearchResponse>::success(std::move(response));
}

} // namespace snapseek::pipeline
