#pragma once

#include "snapseek/common/result.hpp"
#include "snapseek/pipeline/retrieval.hpp"

#include <string>

namespace snapseek::cli {

[[nodiscard]] int run_cli(int argc, char **argv);

/// 0 ok, 2 bad input, 3 model failure, 4 storage or corrupt data, 5 not found, 1 other.
[[nodiscard]] int exit_code_for(common::ErrorKind kind);

/// Media type for a file extension, "application/octet-stream" when unknown.
[[nodiscard]] std::string content_type_for_extension(const std::string &extension);

[[nodiscard]] std::string search_response_to_json(const pipeline::SearchResponse &response);

} // namespace snapseek::cli
