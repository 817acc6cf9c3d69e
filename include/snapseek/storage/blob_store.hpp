#pragma once

#include "snapseek/common/result.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace snapseek::storage {

/// Durable storage for original upload bytes. A storage ref is the generated
/// file name, never a caller-supplied path.
class IBlobStore {
public:
  virtual ~IBlobStore() = default;

  [[nodiscard]] virtual common::Result<std::string> persist_bytes(std::string_view bytes,
                                                                  const std::string &extension) = 0;
  [[nodiscard]] virtual common::Result<std::string> read_bytes(const std::string &ref) = 0;
  /// Deleting a ref that is already gone succeeds.
  [[nodiscard]] virtual common::Status delete_bytes(const std::string &ref) = 0;
  [[nodiscard]] virtual bool exists(const std::string &ref) = 0;
  [[nodiscard]] virtual std::filesystem::path path_for(const std::string &ref) const = 0;
};

class FileBlobStore final : public IBlobStore {
public:
  explicit FileBlobStore(std::filesystem::path root);

  [[nodiscard]] common::Result<std::string> persist_bytes(std::string_view bytes,
                                                          const std::string &extension) override;
  [[nodiscard]] common::Result<std::string> read_bytes(const std::string &ref) override;
  [[nodiscard]] common::Status delete_bytes(const std::string &ref) override;
  [[nodiscard]] bool exists(const std::string &ref) override;
  [[nodiscard]] std::filesystem::path path_for(const std::string &ref) const override;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
};

/// Random RFC 4122 version 4 UUID, lower-case hex with dashes.
[[nodiscard]] std::string generate_uuid_v4();

[[nodiscard]] bool is_valid_storage_ref(const std::string &ref);

} // namespace snapseek::storage
