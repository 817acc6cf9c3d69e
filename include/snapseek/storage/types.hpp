#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace snapseek::storage {

/// One ingested image as seen by the core. `vector_blob` is the codec's
/// serialized vector and is kept byte-for-byte.
struct StoredItem {
  std::int64_t id = 0;
  std::string filename;
  std::string original_filename;
  std::string caption;
  std::string vector_blob;
  std::string file_path;
  std::uint64_t size_bytes = 0;
  std::string content_type;
  std::string created_at;
};

struct NewRecord {
  std::string filename;
  std::string original_filename;
  std::string caption;
  std::string vector_blob;
  std::string file_path;
  std::uint64_t size_bytes = 0;
  std::string content_type;
};

struct VectorLayout {
  std::size_t dimensions = 0;
  std::size_t element_size = 0;
  std::string embedder;
};

[[nodiscard]] std::string now_rfc3339();

} // namespace snapseek::storage
