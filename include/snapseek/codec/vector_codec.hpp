#pragma once

#include "snapseek/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace snapseek::codec {

/// Serialized vector layout (all integers little-endian):
///
///   0   4    magic "SSV1"
///   4   1    element size in bytes, always 4 (IEEE-754 binary32)
///   5   3    reserved, zero
///   8   4    dimension count (uint32)
///   12  4*D  components, binary32 little-endian
///
/// The layout is independent of host byte order so blobs can be read by any
/// implementation.
class VectorCodec {
public:
  static constexpr std::size_t kHeaderSize = 12;
  static constexpr std::size_t kElementSize = sizeof(float);
  static constexpr std::uint32_t kMagic = 0x31565353; // "SSV1" read as LE uint32

  explicit VectorCodec(std::size_t dimensions);

  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }
  [[nodiscard]] std::size_t blob_size() const { return kHeaderSize + dimensions_ * kElementSize; }

  [[nodiscard]] common::Result<std::string> encode(const std::vector<float> &vector) const;
  [[nodiscard]] common::Result<std::vector<float>> decode(std::string_view blob) const;

private:
  std::size_t dimensions_;
};

} // namespace snapseek::codec
