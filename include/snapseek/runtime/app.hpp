#pragma once

#include "snapseek/codec/vector_codec.hpp"
#include "snapseek/common/result.hpp"
#include "snapseek/config/schema.hpp"
#include "snapseek/models/model_service.hpp"
#include "snapseek/pipeline/ingestion.hpp"
#include "snapseek/pipeline/retrieval.hpp"
#include "snapseek/ranking/similarity_ranker.hpp"
#include "snapseek/storage/blob_store.hpp"
#include "snapseek/storage/record_store.hpp"

#include <filesystem>
#include <memory>

namespace snapseek::runtime {

constexpr std::size_t kMaxHistoryLimit = 100;

struct StatusReport {
  std::size_t records = 0;
  std::string caption_backend;
  std::string embedding_backend;
  std::string record_backend;
  std::size_t dimensions = 0;
  bool storage_healthy = false;
};

/// Process-wide composition root. Built once at startup; every collaborator
/// is owned here and handed to the pipelines by reference.
class Application {
public:
  /// Builds the configured backends and stores, and installs the observer.
  [[nodiscard]] static common::Result<std::unique_ptr<Application>>
  create(config::Config config, std::shared_ptr<models::HttpClient> http_client = nullptr);

  /// Wires already-built collaborators and pins the collection's vector layout.
  [[nodiscard]] static common::Result<std::unique_ptr<Application>>
  assemble(config::Config config, std::unique_ptr<models::ModelService> models,
           std::unique_ptr<storage::IBlobStore> blobs,
           std::unique_ptr<storage::IRecordStore> records);

  Application(const Application &) = delete;
  Application &operator=(const Application &) = delete;

  [[nodiscard]] common::Result<pipeline::IngestReceipt>
  ingest(const pipeline::IngestRequest &request);
  [[nodiscard]] common::Result<pipeline::SearchResponse>
  search(const pipeline::SearchRequest &request);

  [[nodiscard]] common::Result<std::vector<storage::StoredItem>> history(std::size_t limit,
                                                                         std::size_t offset);
  [[nodiscard]] common::Result<storage::StoredItem> details(std::int64_t id);
  /// Writes the original upload to `destination`, or into it when it is a directory.
  [[nodiscard]] common::Result<std::filesystem::path>
  export_image(std::int64_t id, const std::filesystem::path &destination);
  [[nodiscard]] common::Status remove(std::int64_t id);
  [[nodiscard]] common::Result<StatusReport> status();

  [[nodiscard]] const config::Config &config() const { return config_; }

private:
  Application(config::Config config, std::unique_ptr<models::ModelService> models,
              std::unique_ptr<storage::IBlobStore> blobs,
              std::unique_ptr<storage::IRecordStore> records);

  config::Config config_;
  std::unique_ptr<models::ModelService> models_;
  std::unique_ptr<storage::IBlobStore> blobs_;
  std::unique_ptr<storage::IRecordStore> records_;
  codec::VectorCodec codec_;
  ranking::LinearScanRanker ranker_;
  pipeline::IngestionPipeline ingestion_;
  pipeline::RetrievalPipeline retrieval_;
};

} // namespace snapseek::runtime
