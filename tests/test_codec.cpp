#include "test_framework.hpp"

#include "snapseek/codec/vector_codec.hpp"

#include <bit>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <limits>
#include <random>

namespace {

bool bitwise_equal(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::bit_cast<std::uint32_t>(a[i]) != std::bit_cast<std::uint32_t>(b[i])) {
      return false;
    }
  }
  return true;
}

std::string valid_blob(const std::size_t dimensions) {
  snapseek::codec::VectorCodec codec(dimensions);
  return codec.encode(std::vector<float>(dimensions, 0.5F)).value();
}

} // namespace

void register_codec_tests(std::vector<snapseek::tests::TestCase> &tests) {
  using snapseek::tests::require;
  namespace cd = snapseek::codec;
  using snapseek::common::ErrorKind;

  tests.push_back({"codec_roundtrip_is_bit_exact", [] {
                     cd::VectorCodec codec(8);
                     const std::vector<float> input = {
                         0.0F,
                         -0.0F,
                         1.0F,
                         -1.0F,
                         std::numeric_limits<float>::denorm_min(),
                         std::numeric_limits<float>::max(),
                         std::numeric_limits<float>::lowest(),
                         0.1F,
                     };
                     const auto blob = codec.encode(input);
                     require(blob.ok(), blob.error());
                     const auto decoded = codec.decode(blob.value());
                     require(decoded.ok(), decoded.error());
                     require(bitwise_equal(decoded.value(), input), "roundtrip changed a component");
                   }});

  tests.push_back({"codec_roundtrip_random_vectors", [] {
                     std::mt19937 rng(7);
                     std::normal_distribution<float> dist(0.0F, 1.0F);
                     cd::VectorCodec codec(384);
                     for (int round = 0; round < 20; ++round) {
                       std::vector<float> input(384);
                       for (auto &value : input) {
                         value = dist(rng);
                       }
                       const auto decoded = codec.decode(codec.encode(input).value());
                       require(decoded.ok(), decoded.error());
                       require(bitwise_equal(decoded.value(), input), "random roundtrip mismatch");
                     }
                   }});

  tests.push_back({"codec_layout_is_little_endian_with_header", [] {
                     cd::VectorCodec codec(2);
                     const auto blob = codec.encode({1.0F, -2.0F});
                     require(blob.ok(), blob.error());
                     const std::string &b = blob.value();
                     require(b.size() == 20, "blob should be 12 + 2*4 bytes");
                     require(b.size() == codec.blob_size(), "blob_size mismatch");
                     require(b.substr(0, 4) == "SSV1", "magic should read SSV1");
                     require(static_cast<unsigned char>(b[4]) == 4, "element size byte");
                     require(b[5] == '\0' && b[6] == '\0' && b[7] == '\0', "reserved bytes");
                     require(static_cast<unsigned char>(b[8]) == 2 && b[9] == '\0' &&
                                 b[10] == '\0' && b[11] == '\0',
                             "dimension count should be little-endian 2");
                     // 1.0f == 0x3F800000
                     require(static_cast<unsigned char>(b[12]) == 0x00 &&
                                 static_cast<unsigned char>(b[13]) == 0x00 &&
                                 static_cast<unsigned char>(b[14]) == 0x80 &&
                                 static_cast<unsigned char>(b[15]) == 0x3F,
                             "first component bytes");
                     // -2.0f == 0xC0000000
                     require(static_cast<unsigned char>(b[19]) == 0xC0, "second component sign byte");
                   }});

  tests.push_back({"codec_encode_rejects_wrong_length", [] {
                     cd::VectorCodec codec(4);
                     const auto blob = codec.encode({1.0F, 2.0F, 3.0F});
                     require(!blob.ok(), "short vector should fail");
                     require(blob.kind() == ErrorKind::Validation, "expected validation error");
                   }});

  tests.push_back({"codec_encode_rejects_non_finite", [] {
                     cd::VectorCodec codec(2);
                     const auto nan_blob = codec.encode({std::nanf(""), 1.0F});
                     require(!nan_blob.ok() && nan_blob.kind() == ErrorKind::Validation,
                             "NaN should be rejected");
                     const auto inf_blob =
                         codec.encode({1.0F, std::numeric_limits<float>::infinity()});
                     require(!inf_blob.ok() && inf_blob.kind() == ErrorKind::Validation,
                             "infinity should be rejected");
                   }});

  tests.push_back({"codec_decode_rejects_truncated_payload", [] {
                     cd::VectorCodec codec(4);
                     auto blob = valid_blob(4);
                     blob.pop_back();
                     const auto decoded = codec.decode(blob);
                     require(!decoded.ok(), "truncated blob should fail");
                     require(decoded.kind() == ErrorKind::CorruptVector, "expected corrupt vector");

                     blob.resize(blob.size() - 3);
                     require(codec.decode(blob).kind() == ErrorKind::CorruptVector,
                             "whole-element truncation should fail");
                   }});

  tests.push_back({"codec_decode_rejects_trailing_bytes", [] {
                     cd::VectorCodec codec(4);
                     auto blob = valid_blob(4);
                     blob.push_back('\0');
                     require(codec.decode(blob).kind() == ErrorKind::CorruptVector,
                             "extra byte should fail");
                   }});

  tests.push_back({"codec_decode_rejects_short_header", [] {
                     cd::VectorCodec codec(4);
                     require(codec.decode("").kind() == ErrorKind::CorruptVector,
                             "empty blob should fail");
                     require(codec.decode("SSV1").kind() == ErrorKind::CorruptVector,
                             "magic-only blob should fail");
                   }});

  tests.push_back({"codec_decode_rejects_bad_magic", [] {
                     cd::VectorCodec codec(4);
                     auto blob = valid_blob(4);
                     blob[0] = 'X';
                     require(codec.decode(blob).kind() == ErrorKind::CorruptVector,
                             "bad magic should fail");
                   }});

  tests.push_back({"codec_decode_rejects_other_precision", [] {
                     cd::VectorCodec codec(4);
                     auto blob = valid_blob(4);
                     blob[4] = static_cast<char>(8);
                     require(codec.decode(blob).kind() == ErrorKind::CorruptVector,
                             "element size 8 should fail");
                   }});

  tests.push_back({"codec_decode_rejects_dimension_mismatch", [] {
                     cd::VectorCodec writer(3);
                     cd::VectorCodec reader(4);
                     const auto blob = writer.encode({1.0F, 2.0F, 3.0F});
                     require(blob.ok(), blob.error());
                     require(reader.decode(blob.value()).kind() == ErrorKind::CorruptVector,
                             "3-dim blob must not decode as 4-dim");
                   }});

  tests.push_back({"codec_decode_rejects_lying_dimension_header", [] {
                     cd::VectorCodec codec(4);
                     auto blob = valid_blob(4);
                     blob[8] = static_cast<char>(5);
                     require(codec.decode(blob).kind() == ErrorKind::CorruptVector,
                             "header dimension must match codec");
                   }});
}
