#pragma once

#include "snapseek/codec/vector_codec.hpp"
#include "snapseek/common/result.hpp"
#include "snapseek/models/model_service.hpp"
#include "snapseek/storage/blob_store.hpp"
#include "snapseek/storage/record_store.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace snapseek::pipeline {

struct IngestLimits {
  std::uint64_t max_file_size = 10'485'760;
  std::vector<std::string> allowed_extensions = {"jpg", "jpeg", "png"};
};

struct IngestRequest {
  std::string_view bytes;
  std::string content_type;
  std::string filename;
};

struct IngestReceipt {
  std::int64_t id = 0;
  std::string filename;
  std::string original_filename;
  std::string caption;
  std::string created_at;
  std::uint64_t size_bytes = 0;
  std::string message;
};

/// Received -> Validated -> Persisted -> Captioned -> Embedded -> Stored.
///
/// Validation runs before any byte is written. Once the upload is persisted,
/// every failure deletes it again, so a failed attempt leaves neither a record
/// nor an orphaned file behind.
class IngestionPipeline {
public:
  IngestionPipeline(models::ModelService &models, storage::IBlobStore &blobs,
                    storage::IRecordStore &records, const codec::VectorCodec &codec,
                    IngestLimits limits);

  [[nodiscard]] common::Result<IngestReceipt> ingest(const IngestRequest &request);

  [[nodiscard]] common::Status validate(const IngestRequest &request) const;

private:
  models::ModelService &models_;
  storage::IBlobStore &blobs_;
  storage::IRecordStore &records_;
  const codec::VectorCodec &codec_;
  IngestLimits limits_;
};

/// Lower-cased media type without parameters ("Image/JPEG; q=1" -> "image/jpeg").
[[nodiscard]] std::string normalize_content_type(const std::string &content_type);

} // namespace snapseek::pipeline
