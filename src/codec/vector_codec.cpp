#include "snapseek/codec/vector_codec.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace snapseek::codec {

namespace {

static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559,
              "vector blobs require IEEE-754 binary32 floats");

void put_u32(std::string &out, const std::uint32_t value) {
  out.push_back(static_cast<char>(value & 0xFFU));
  out.push_back(static_cast<char>((value >> 8) & 0xFFU));
  out.push_back(static_cast<char>((value >> 16) & 0xFFU));
  out.push_back(static_cast<char>((value >> 24) & 0xFFU));
}

std::uint32_t get_u32(const std::string_view in, const std::size_t offset) {
  const auto byte = [&](std::size_t i) {
    return static_cast<std::uint32_t>(static_cast<unsigned char>(in[offset + i]));
  };
  return byte(0) | (byte(1) << 8) | (byte(2) << 16) | (byte(3) << 24);
}

common::Result<std::vector<float>> corrupt(const std::string &message) {
  return common::Result<std::vector<float>>::failure(common::ErrorKind::CorruptVector, message);
}

} // namespace

VectorCodec::VectorCodec(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Result<std::string> VectorCodec::encode(const std::vector<float> &vector) const {
  if (vector.size() != dimensions_) {
    return common::Result<std::string>::failure(
        common::ErrorKind::Validation, "vector has " + std::to_string(vector.size()) +
                                           " components, expected " + std::to_string(dimensions_));
  }

  std::string blob;
  blob.reserve(blob_size());
  put_u32(blob, kMagic);
  blob.push_back(static_cast<char>(kElementSize));
  blob.append(3, '\0');
  put_u32(blob, static_cast<std::uint32_t>(dimensions_));

  for (const float value : vector) {
    if (!std::isfinite(value)) {
      return common::Result<std::string>::failure(common::ErrorKind::Validation,
                                                  "vector contains a non-finite component");
    }
    put_u32(blob, std::bit_cast<std::uint32_t>(value));
  }

  return common::Result<std::string>::success(std::move(blob));
}

common::Result<std::vector<float>> VectorCodec::decode(const std::string_view blob) const {
  if (blob.size() < kHeaderSize) {
    return corrupt("vector blob is " + std::to_string(blob.size()) + " bytes, shorter than header");
  }
  if (get_u32(blob, 0) != kMagic) {
    return corrupt("vector blob has unknown magic");
  }

  const auto element_size = static_cast<std::size_t>(static_cast<unsigned char>(blob[4]));
  if (element_size != kElementSize) {
    return corrupt("vector blob element size " + std::to_string(element_size) + " does not match " +
                   std::to_string(kElementSize));
  }

  const std::size_t declared = get_u32(blob, 8);
  if (declared != dimensions_) {
    return corrupt("vector blob declares " + std::to_string(declared) + " dimensions, expected " +
                   std::to_string(dimensions_));
  }

  const std::size_t payload = blob.size() - kHeaderSize;
  if (payload % kElementSize != 0 || payload / kElementSize != dimensions_) {
    return corrupt("vector blob payload is " + std::to_string(payload) + " bytes, expected " +
                   std::to_string(dimensions_ * kElementSize));
  }

  std::vector<float> values(dimensions_);
  for (std::size_t i = 0; i < dimensions_; ++i) {
    values[i] = std::bit_cast<float>(get_u32(blob, kHeaderSize + i * kElementSize));
  }
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace snapseek::codec
