#include "snapseek/runtime/app.hpp"

#include "snapseek/config/config.hpp"
#include "snapseek/observability/factory.hpp"
#include "snapseek/observability/global.hpp"
#include "snapseek/storage/sqlite_record_store.hpp"

#include <fstream>

namespace snapseek::runtime {

namespace {

pipeline::IngestLimits ingest_limits(const config::Config &config) {
  return pipeline::IngestLimits{.max_file_size = config.storage.max_file_size,
                                .allowed_extensions = config.storage.allowed_extensions};
}

} // namespace

Application::Application(config::Config config, std::unique_ptr<models::ModelService> models,
                         std::unique_ptr<storage::IBlobStore> blobs,
                         std::unique_ptr<storage::IRecordStore> records)
    : config_(std::move(config)), models_(std::move(models)), blobs_(std::move(blobs)),
      records_(std::move(records)), codec_(models_->dimensions()),
      ingestion_(*models_, *blobs_, *records_, codec_, ingest_limits(config_)),
      retrieval_(*models_, *records_, codec_, ranker_, config_.search.max_limit) {}

common::Result<std::unique_ptr<Application>>
Application::create(config::Config config, std::shared_ptr<models::HttpClient> http_client) {
  using AppResult = common::Result<std::unique_ptr<Application>>;

  observability::set_global_observer(observability::create_observer(config));

  auto models = models::ModelService::create(config, std::move(http_client));
  if (!models.ok()) {
    return AppResult::failure(models.kind(), models.error());
  }

  auto records = storage::SqliteRecordStore::open(config::resolve_database_path(config));
  if (!records.ok()) {
    return AppResult::failure(records.kind(), records.error());
  }

  auto blobs = std::make_unique<storage::FileBlobStore>(config::resolve_upload_dir(config));
  return assemble(std::move(config), std::move(models.value()), std::move(blobs),
                  std::move(records.value()));
}

common::Result<std::unique_ptr<Application>>
Application::assemble(config::Config config, std::unique_ptr<models::ModelService> models,
                      std::unique_ptr<storage::IBlobStore> blobs,
                      std::unique_ptr<storage::IRecordStore> records) {
  using AppResult = common::Result<std::unique_ptr<Application>>;
  if (models == nullptr || blobs == nullptr || records == nullptr) {
    return AppResult::failure(common::ErrorKind::Internal, "application is missing a collaborator");
  }

  const storage::VectorLayout layout{.dimensions = models->dimensions(),
                                     .element_size = codec::VectorCodec::kElementSize,
                                     .embedder = std::string(models->embedding_backend())};
  if (auto status = records->bind_vector_layout(layout); !status.ok()) {
    return AppResult::failure(status.kind(), status.error());
  }

  return AppResult::success(std::unique_ptr<Application>(new Application(
      std::move(config), std::move(models), std::move(blobs), std::move(records))));
}

common::Result<pipeline::IngestReceipt> Application::ingest(const pipeline::IngestRequest &request) {
  return ingestion_.ingest(request);
}

common::Result<pipeline::SearchResponse>
Application::search(const pipeline::SearchRequest &request) {
  return retrieval_.search(request);
}

common::Result<std::vector<storage::StoredItem>> Application::history(const std::size_t limit,
                                                                      const std::size_t offset) {
  if (limit < 1 || limit > kMaxHistoryLimit) {
    return common::Result<std::vector<storage::StoredItem>>::failure(
        common::ErrorKind::Validation,
        "limit must be between 1 and " + std::to_string(kMaxHistoryLimit));
  }
  return records_->list_records(offset, limit);
}

common::Result<storage::StoredItem> Application::details(const std::int64_t id) {
  auto record = records_->get_record(id);
  if (!record.ok()) {
    return common::Result<storage::StoredItem>::failure(record.kind(), record.error());
  }
  if (!record.value().has_value()) {
    return common::Result<storage::StoredItem>::failure(common::ErrorKind::NotFound,
                                                        "Image not found: " + std::to_string(id));
  }
  return common::Result<storage::StoredItem>::success(std::move(*record.value()));
}

common::Result<std::filesystem::path>
Application::export_image(const std::int64_t id, const std::filesystem::path &destination) {
  using PathResult = common::Result<std::filesystem::path>;

  auto item = details(id);
  if (!item.ok()) {
    return PathResult::failure(item.kind(), item.error());
  }
  auto bytes = blobs_->read_bytes(item.value().filename);
  if (!bytes.ok()) {
    return PathResult::failure(bytes.kind(), "Image file not found on disk: " + bytes.error());
  }

  std::filesystem::path target = destination;
  std::error_code ec;
  if (std::filesystem::is_directory(destination, ec)) {
    const auto &name = item.value().original_filename.empty() ? item.value().filename
                                                              : item.value().original_filename;
    target = destination / name;
  }

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out) {
    return PathResult::failure(common::ErrorKind::Storage, "failed to open " + target.string());
  }
  out.write(bytes.value().data(), static_cast<std::streamsize>(bytes.value().size()));
  if (!out) {
    return PathResult::failure(common::ErrorKind::Storage, "failed to write " + target.string());
  }
  return PathResult::success(std::move(target));
}

common::Status Application::remove(const std::int64_t id) {
  auto item = details(id);
  if (!item.ok()) {
    return common::Status::error(item.kind(), item.error());
  }

  if (auto status = blobs_->delete_bytes(item.value().filename); !status.ok()) {
    return status;
  }
  auto deleted = records_->delete_record(id);
  if (!deleted.ok()) {
    return common::Status::error(deleted.kind(), deleted.error());
  }
  if (!deleted.value()) {
    return common::Status::error(common::ErrorKind::NotFound,
                                 "Image not found: " + std::to_string(id));
  }
  return common::Status::success();
}

common::Result<StatusReport> Application::status() {
  auto count = records_->count();
  if (!count.ok()) {
    return common::Result<StatusReport>::failure(count.kind(), count.error());
  }
  return common::Result<StatusReport>::success(StatusReport{
      .records = count.value(),
      .caption_backend = std::string(models_->caption_backend()),
      .embedding_backend = std::string(models_->embedding_backend()),
      .record_backend = std::string(records_->name()),
      .dimensions = models_->dimensions(),
      .storage_healthy = records_->health_check(),
  });
}

} // namespace snapseek::runtime
