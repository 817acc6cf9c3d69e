#include "snapseek/storage/blob_store.hpp"

#include "snapseek/common/fs.hpp"

#include <openssl/rand.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace snapseek::storage {

std::string generate_uuid_v4() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      stream << '-';
    }
    stream << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return stream.str();
}

bool is_valid_storage_ref(const std::string &ref) {
  if (ref.empty() || ref == "." || ref == "..") {
    return false;
  }
  return common::sanitize_filename(ref) == ref && ref.front() != '.';
}

FileBlobStore::FileBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileBlobStore::path_for(const std::string &ref) const { return root_ / ref; }

common::Result<std::string> FileBlobStore::persist_bytes(const std::string_view bytes,
                                                         const std::string &extension) {
  auto dir = common::ensure_dir(root_);
  if (!dir.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Storage, dir.error());
  }

  std::string ref = generate_uuid_v4();
  const std::string ext = common::sanitize_filename(common::to_lower(extension));
  if (!ext.empty()) {
    ref += "." + ext;
  }

  const auto final_path = path_for(ref);
  const auto tmp_path = root_ / ("." + ref + ".tmp");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return common::Result<std::string>::failure(common::ErrorKind::Storage,
                                                  "failed to open " + tmp_path.string());
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      std::filesystem::remove(tmp_path, ignored);
      return common::Result<std::string>::failure(common::ErrorKind::Storage,
                                                  "failed to write " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, final_path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    return common::Result<std::string>::failure(common::ErrorKind::Storage,
                                                "failed to store upload: " + ec.message());
  }
  return common::Result<std::string>::success(std::move(ref));
}

common::Result<std::string> FileBlobStore::read_bytes(const std::string &ref) {
  if (!is_valid_storage_ref(ref)) {
    return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                "invalid storage ref: " + ref);
  }
  const auto path = path_for(ref);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                                "stored file missing: " + ref);
  }
  auto bytes = common::read_file_bytes(path);
  if (!bytes.ok()) {
    return common::Result<std::string>::failure(common::ErrorKind::Storage, bytes.error());
  }
  return bytes;
}

common::Status FileBlobStore::delete_bytes(const std::string &ref) {
  if (!is_valid_storage_ref(ref)) {
    return common::Status::error(common::ErrorKind::Validation, "invalid storage ref: " + ref);
  }
  std::error_code ec;
  std::filesystem::remove(path_for(ref), ec);
  if (ec) {
    return common::Status::error(common::ErrorKind::Storage,
                                 "failed to delete " + ref + ": " + ec.message());
  }
  return common::Status::success();
}

bool FileBlobStore::exists(const std::string &ref) {
  if (!is_valid_storage_ref(ref)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(ref), ec);
}

} // namespace snapseek::storage
