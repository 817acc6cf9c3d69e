#pragma once

#include "snapseek/common/result.hpp"
#include "snapseek/storage/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace snapseek::storage {

class IRecordStore {
public:
  virtual ~IRecordStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Pins the collection to one vector layout. Fails with Configuration when
  /// stored records were written with a different dimension or element size.
  [[nodiscard]] virtual common::Status bind_vector_layout(const VectorLayout &layout) = 0;

  [[nodiscard]] virtual common::Result<StoredItem> create_record(const NewRecord &record) = 0;
  /// Point-in-time snapshot of every record, ascending id.
  [[nodiscard]] virtual common::Result<std::vector<StoredItem>> list_all_records() = 0;
  /// Newest first (created_at, then id, descending).
  [[nodiscard]] virtual common::Result<std::vector<StoredItem>> list_records(std::size_t offset,
                                                                            std::size_t limit) = 0;
  [[nodiscard]] virtual common::Result<std::optional<StoredItem>> get_record(std::int64_t id) = 0;
  [[nodiscard]] virtual common::Result<bool> delete_record(std::int64_t id) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count() = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace snapseek::storage
