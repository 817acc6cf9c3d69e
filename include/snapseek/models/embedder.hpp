#pragma once

#include "snapseek/common/result.hpp"
#include "snapseek/config/schema.hpp"
#include "snapseek/models/http_client.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace snapseek::models {

/// Maps text to a vector of exactly dimensions() components. The same
/// instance embeds captions at ingestion and queries at retrieval.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
  [[nodiscard]] virtual bool thread_safe() const { return false; }
};

/// Rejects backend answers whose length is not `expected`.
[[nodiscard]] common::Result<std::vector<float>>
check_dimensions(common::Result<std::vector<float>> vector, std::size_t expected,
                 std::string_view backend);

[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config, std::shared_ptr<HttpClient> http_client);

} // namespace snapseek::models
