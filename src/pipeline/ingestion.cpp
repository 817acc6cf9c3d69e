#include "snapseek/pipeline/ingestion.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/models/image.hpp"
#include "snapseek/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace snapseek::pipeline {

namespace {

constexpr const char *kSuccessMessage = "Image uploaded and processed successfully";

/// Deletes persisted upload bytes unless the attempt reached Stored.
class PersistedBytesGuard {
public:
  PersistedBytesGuard(storage::IBlobStore &blobs, std::string ref)
      : blobs_(blobs), ref_(std::move(ref)) {}

  PersistedBytesGuard(const PersistedBytesGuard &) = delete;
  PersistedBytesGuard &operator=(const PersistedBytesGuard &) = delete;

  ~PersistedBytesGuard() {
    if (committed_) {
      return;
    }
    const auto status = blobs_.delete_bytes(ref_);
    observability::record_cleanup(ref_, status.ok());
    if (!status.ok()) {
      observability::record_error("ingest", "cleanup of " + ref_ + " failed: " + status.error());
    }
  }

  void commit() { committed_ = true; }

private:
  storage::IBlobStore &blobs_;
  std::string ref_;
  bool committed_ = false;
};

template <typename T>
common::Result<IngestReceipt> fail(const std::string &stage, const common::Result<T> &result) {
  observability::record_ingest_failed(stage, std::string(common::error_kind_name(result.kind())),
                                      result.error());
  return common::Result<IngestReceipt>::failure(result.kind(), result.error());
}

common::Result<IngestReceipt> fail(const std::string &stage, const common::Status &status) {
  observability::record_ingest_failed(stage, std::string(common::error_kind_name(status.kind())),
                                      status.error());
  return common::Result<IngestReceipt>::failure(status.kind(), status.error());
}

} // namespace

std::string normalize_content_type(const std::string &content_type) {
  const auto separator = content_type.find(';');
  return common::to_lower(common::trim(content_type.substr(0, separator)));
}

IngestionPipeline::IngestionPipeline(models::ModelService &models, storage::IBlobStore &blobs,
                                     storage::IRecordStore &records,
                                     const codec::VectorCodec &codec, IngestLimits limits)
    : models_(models), blobs_(blobs), records_(records), codec_(codec),
      limits_(std::move(limits)) {
  for (auto &extension : limits_.allowed_extensions) {
    extension = common::to_lower(common::trim(extension));
    if (common::starts_with(extension, ".")) {
      extension.erase(0, 1);
    }
  }
}

common::Status IngestionPipeline::validate(const IngestRequest &request) const {
  if (!common::starts_with(normalize_content_type(request.content_type), "image/")) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "File must be an image (content type '" + request.content_type +
                                     "')");
  }

  const std::string extension = common::file_extension(request.filename);
  if (extension.empty() ||
      std::find(limits_.allowed_extensions.begin(), limits_.allowed_extensions.end(), extension) ==
          limits_.allowed_extensions.end()) {
    std::string allowed;
    for (const auto &item : limits_.allowed_extensions) {
      allowed += (allowed.empty() ? "" : ", ") + item;
    }
    return common::Status::error(common::ErrorKind::Validation,
                                 "Only " + allowed + " images are supported");
  }

  if (request.bytes.empty()) {
    return common::Status::error(common::ErrorKind::Validation, "upload is empty");
  }
  if (request.bytes.size() > limits_.max_file_size) {
    return common::Status::error(common::ErrorKind::Validation,
                                 "File size exceeds maximum limit of " +
                                     std::to_string(limits_.max_file_size) + " bytes");
  }
  return common::Status::success();
}

common::Result<IngestReceipt> IngestionPipeline::ingest(const IngestRequest &request) {
  const auto start = std::chrono::steady_clock::now();

  if (auto status = validate(request); !status.ok()) {
    return fail("validate", status);
  }

  const std::string extension = common::file_extension(request.filename);
  auto ref = blobs_.persist_bytes(request.bytes, extension);
  if (!ref.ok()) {
    return fail("persist", ref);
  }
  PersistedBytesGuard guard(blobs_, ref.value());

  // Verify what was written, not the request buffer.
  auto persisted = blobs_.read_bytes(ref.value());
  if (!persisted.ok()) {
    return fail("verify", persisted);
  }
  if (auto image = models::decode_image(persisted.value()); !image.ok()) {
    return fail("verify", common::Result<bool>::failure(common::ErrorKind::InvalidImage,
                                                        "Invalid or corrupted image file: " +
                                                            image.error()));
  }

  auto caption = models_.caption(persisted.value());
  if (!caption.ok()) {
    return fail("caption", caption);
  }

  auto vector = models_.embed(caption.value());
  if (!vector.ok()) {
    return fail("embed", vector);
  }

  auto blob = codec_.encode(vector.value());
  if (!blob.ok()) {
    return fail("encode", blob);
  }

  storage::NewRecord record;
  record.filename = ref.value();
  record.original_filename = common::sanitize_filename(request.filename);
  record.caption = caption.value();
  record.vector_blob = std::move(blob.value());
  record.file_path = blobs_.path_for(ref.value()).string();
  record.size_bytes = request.bytes.size();
  record.content_type = normalize_content_type(request.content_type);

  auto stored = records_.create_record(record);
  if (!stored.ok()) {
    return fail("store", stored);
  }
  guard.commit();

  const auto &item = stored.value();
  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start);
  observability::record_ingest_completed(item.id, item.filename, item.size_bytes, duration);

  return common::Result<IngestReceipt>::success(IngestReceipt{
      .id = item.id,
      .filename = item.filename,
      .original_filename = item.original_filename,
      .caption = item.caption,
      .created_at = item.created_at,
      .size_bytes = item.size_bytes,
      .message = kSuccessMessage,
  });
}

} // namespace snapseek::pipeline
