#include "snapseek/cli/commands.hpp"

#include "snapseek/common/fs.hpp"
#include "snapseek/common/json_util.hpp"
#include "snapseek/config/config.hpp"
#include "snapseek/runtime/app.hpp"

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace snapseek::cli {

namespace {

constexpr std::size_t kDefaultHistoryLimit = 50;

std::string version_string() {
#ifdef SNAPSEEK_VERSION
  return std::string("snapseek ") + SNAPSEEK_VERSION;
#else
  return "snapseek 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

int report(const common::ErrorKind kind, const std::string &message) {
  std::cerr << "error [" << common::error_kind_name(kind) << "]: " << message << "\n";
  return exit_code_for(kind);
}

int usage(const std::string &text) {
  std::cerr << "usage: snapseek " << text << "\n";
  return exit_code_for(common::ErrorKind::Validation);
}

std::optional<std::uint64_t> parse_unsigned(const std::string &text) {
  if (text.empty() || text.front() == '-') {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const auto value = std::stoull(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<double> parse_double(const std::string &text) {
  try {
    std::size_t consumed = 0;
    const double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

std::optional<std::int64_t> parse_id(const std::string &text) {
  const auto value = parse_unsigned(text);
  if (!value.has_value() ||
      *value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(*value);
}

common::Result<std::unique_ptr<runtime::Application>> open_app() {
  using AppResult = common::Result<std::unique_ptr<runtime::Application>>;
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return AppResult::failure(cfg.kind(), cfg.error());
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return AppResult::failure(common::ErrorKind::Configuration, warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  return runtime::Application::create(std::move(cfg.value()));
}

void print_item(const storage::StoredItem &item) {
  std::cout << "#" << item.id << "  " << item.caption << "\n";
  std::cout << "    file: " << item.filename;
  if (!item.original_filename.empty()) {
    std::cout << " (" << item.original_filename << ")";
  }
  std::cout << "\n";
  std::cout << "    " << item.content_type << ", " << item.size_bytes << " bytes, uploaded "
            << item.created_at << "\n";
}

int run_ingest(std::vector<std::string> args) {
  std::string content_type;
  const bool explicit_type = take_option(args, "--content-type", "-t", content_type);
  if (args.size() != 1) {
    return usage("ingest <file> [--content-type TYPE]");
  }

  const std::filesystem::path path = common::expand_path(args[0]);
  auto bytes = common::read_file_bytes(path);
  if (!bytes.ok()) {
    return report(common::ErrorKind::Validation, bytes.error());
  }
  const std::string filename = path.filename().string();
  if (!explicit_type) {
    content_type = content_type_for_extension(common::file_extension(filename));
  }

  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }

  auto receipt = app.value()->ingest(pipeline::IngestRequest{
      .bytes = bytes.value(), .content_type = content_type, .filename = filename});
  if (!receipt.ok()) {
    return report(receipt.kind(), receipt.error());
  }

  const auto &r = receipt.value();
  std::cout << r.message << "\n";
  std::cout << "  id:       " << r.id << "\n";
  std::cout << "  file:     " << r.filename << "\n";
  std::cout << "  caption:  " << r.caption << "\n";
  std::cout << "  size:     " << r.size_bytes << " bytes\n";
  std::cout << "  uploaded: " << r.created_at << "\n";
  return 0;
}

int run_search(std::vector<std::string> args) {
  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }
  const auto &search_config = app.value()->config().search;

  pipeline::SearchRequest request;
  request.limit = search_config.default_limit;
  request.threshold = search_config.default_threshold;

  std::string value;
  if (take_option(args, "--limit", "-n", value)) {
    const auto limit = parse_unsigned(value);
    if (!limit.has_value()) {
      return report(common::ErrorKind::Validation, "invalid --limit: " + value);
    }
    request.limit = static_cast<std::size_t>(*limit);
  }
  if (take_option(args, "--threshold", "", value)) {
    const auto threshold = parse_double(value);
    if (!threshold.has_value()) {
      return report(common::ErrorKind::Validation, "invalid --threshold: " + value);
    }
    request.threshold = *threshold;
  }
  const bool as_json = take_flag(args, "--json");
  request.query = join_tokens(args);

  auto response = app.value()->search(request);
  if (!response.ok()) {
    return report(response.kind(), response.error());
  }

  if (as_json) {
    std::cout << search_response_to_json(response.value()) << "\n";
    return 0;
  }

  const auto &r = response.value();
  std::cout << r.total_results << " result(s) for \"" << r.query << "\"\n";
  for (const auto &hit : r.results) {
    std::cout << "  " << std::fixed << std::setprecision(4) << hit.score << "  #" << hit.id << "  "
              << hit.caption << "  (" << hit.filename << ")\n";
  }
  return 0;
}

int run_history(std::vector<std::string> args) {
  std::size_t limit = kDefaultHistoryLimit;
  std::size_t offset = 0;
  std::string value;
  if (take_option(args, "--limit", "-n", value)) {
    const auto parsed = parse_unsigned(value);
    if (!parsed.has_value()) {
      return report(common::ErrorKind::Validation, "invalid --limit: " + value);
    }
    limit = static_cast<std::size_t>(*parsed);
  }
  if (take_option(args, "--offset", "", value)) {
    const auto parsed = parse_unsigned(value);
    if (!parsed.has_value()) {
      return report(common::ErrorKind::Validation, "invalid --offset: " + value);
    }
    offset = static_cast<std::size_t>(*parsed);
  }

  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }
  auto items = app.value()->history(limit, offset);
  if (!items.ok()) {
    return report(items.kind(), items.error());
  }
  if (items.value().empty()) {
    std::cout << "No images stored.\n";
  }
  for (const auto &item : items.value()) {
    print_item(item);
  }
  return 0;
}

int run_show(const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return usage("show <id>");
  }
  const auto id = parse_id(args[0]);
  if (!id.has_value()) {
    return report(common::ErrorKind::Validation, "invalid id: " + args[0]);
  }
  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }
  auto item = app.value()->details(*id);
  if (!item.ok()) {
    return report(item.kind(), item.error());
  }
  print_item(item.value());
  return 0;
}

int run_export(const std::vector<std::string> &args) {
  if (args.size() != 2) {
    return usage("export <id> <destination>");
  }
  const auto id = parse_id(args[0]);
  if (!id.has_value()) {
    return report(common::ErrorKind::Validation, "invalid id: " + args[0]);
  }
  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }
  auto written = app.value()->export_image(*id, common::expand_path(args[1]));
  if (!written.ok()) {
    return report(written.kind(), written.error());
  }
  std::cout << "Exported #" << *id << " to " << written.value().string() << "\n";
  return 0;
}

int run_delete(const std::vector<std::string> &args) {
  if (args.size() != 1) {
    return usage("delete <id>");
  }
  const auto id = parse_id(args[0]);
  if (!id.has_value()) {
    return report(common::ErrorKind::Validation, "invalid id: " + args[0]);
  }
  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }
  if (auto status = app.value()->remove(*id); !status.ok()) {
    return report(status.kind(), status.error());
  }
  std::cout << "Image deleted successfully\n";
  return 0;
}

int run_status() {
  auto app = open_app();
  if (!app.ok()) {
    return report(app.kind(), app.error());
  }
  auto report_result = app.value()->status();
  if (!report_result.ok()) {
    return report(report_result.kind(), report_result.error());
  }
  const auto &s = report_result.value();
  const auto &cfg = app.value()->config();
  std::cout << "Images:     " << s.records << "\n";
  std::cout << "Caption:    " << s.caption_backend << " (" << cfg.caption.model << ")\n";
  std::cout << "Embedding:  " << s.embedding_backend << " (" << cfg.embedding.model << ", "
            << s.dimensions << " dimensions)\n";
  std::cout << "Storage:    " << s.record_backend << " "
            << config::resolve_database_path(cfg).string() << " ["
            << (s.storage_healthy ? "ok" : "unhealthy") << "]\n";
  std::cout << "Uploads:    " << config::resolve_upload_dir(cfg).string() << "\n";
  if (auto cp = config::config_path(); cp.ok()) {
    std::cout << "Config:     " << cp.value().string() << "\n";
  }
  return s.storage_healthy ? 0 : exit_code_for(common::ErrorKind::Storage);
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "init") {
    const bool force = take_flag(args, "--force");
    if (config::config_exists() && !force) {
      std::cerr << "config already exists (use --force to overwrite)\n";
      return 1;
    }
    if (auto saved = config::save_config(config::Config{}); !saved.ok()) {
      return report(saved.kind(), saved.error());
    }
    if (auto cp = config::config_path(); cp.ok()) {
      std::cout << "Wrote " << cp.value().string() << "\n";
    }
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return report(cfg.kind(), cfg.error());
  }

  if (action == "show") {
    std::cout << config::render_config(cfg.value());
    return 0;
  }
  if (action == "validate") {
    auto warnings = config::validate_config(cfg.value());
    if (!warnings.ok()) {
      return report(common::ErrorKind::Configuration, warnings.error());
    }
    for (const auto &warning : warnings.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return 0;
  }

  std::cerr << "unknown config command: " << action << "\n";
  return 1;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  snapseek" << RESET << DIM << "  caption images, find them by meaning"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "snapseek [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  IMAGES" << RESET << "\n";
  std::cout << "  " << GREEN << "ingest" << RESET << " FILE" << DIM
            << "              Caption and index an image [--content-type T]" << RESET << "\n";
  std::cout << "  " << GREEN << "search" << RESET << " QUERY" << DIM
            << "             Semantic search [--limit N] [--threshold X] [--json]" << RESET << "\n";
  std::cout << "  " << GREEN << "history" << RESET << DIM
            << "                  Recent uploads [--limit N] [--offset N]" << RESET << "\n";
  std::cout << "  " << GREEN << "show" << RESET << " ID" << DIM
            << "                  Image details" << RESET << "\n";
  std::cout << "  " << GREEN << "export" << RESET << " ID DEST" << DIM
            << "           Copy the original file out" << RESET << "\n";
  std::cout << "  " << GREEN << "delete" << RESET << " ID" << DIM
            << "                Remove an image and its record" << RESET << "\n\n";

  std::cout << BOLD << "  SYSTEM" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << DIM
            << "                   Backends, storage and image count" << RESET << "\n";
  std::cout << "  " << GREEN << "config" << RESET << " show|init|validate" << DIM
            << "  Manage configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "                  Show version"
            << RESET << "\n\n";
}

} // namespace

int exit_code_for(const common::ErrorKind kind) {
  switch (kind) {
  case common::ErrorKind::None:
    return 0;
  case common::ErrorKind::Validation:
  case common::ErrorKind::InvalidImage:
    return 2;
  case common::ErrorKind::ModelFailure:
    return 3;
  case common::ErrorKind::Storage:
  case common::ErrorKind::CorruptVector:
    return 4;
  case common::ErrorKind::NotFound:
    return 5;
  case common::ErrorKind::Configuration:
  case common::ErrorKind::Internal:
    return 1;
  }
  return 1;
}

std::string content_type_for_extension(const std::string &extension) {
  const std::string ext = common::to_lower(extension);
  if (ext == "jpg" || ext == "jpeg") {
    return "image/jpeg";
  }
  if (ext == "png") {
    return "image/png";
  }
  if (ext == "gif") {
    return "image/gif";
  }
  if (ext == "webp") {
    return "image/webp";
  }
  if (ext == "bmp") {
    return "image/bmp";
  }
  if (ext == "tif" || ext == "tiff") {
    return "image/tiff";
  }
  return "application/octet-stream";
}

std::string search_response_to_json(const pipeline::SearchResponse &response) {
  std::ostringstream out;
  out << "{\"query\":\"" << common::json_escape(response.query) << "\",";
  out << "\"total_results\":" << response.total_results << ",";
  out << "\"results\":[";
  for (std::size_t i = 0; i < response.results.size(); ++i) {
    const auto &hit = response.results[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"id\":" << hit.id << ",";
    out << "\"filename\":\"" << common::json_escape(hit.filename) << "\",";
    out << "\"caption\":\"" << common::json_escape(hit.caption) << "\",";
    out << "\"upload_time\":\"" << common::json_escape(hit.created_at) << "\",";
    out << "\"file_size\":" << hit.size_bytes << ",";
    out << "\"content_type\":\"" << common::json_escape(hit.content_type) << "\",";
    out << "\"similarity_score\":" << std::fixed << std::setprecision(4) << hit.score << "}";
  }
  out << "]}";
  return out.str();
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "ingest") {
    return run_ingest(std::move(args));
  }
  if (subcommand == "search") {
    return run_search(std::move(args));
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }
  if (subcommand == "show") {
    return run_show(args);
  }
  if (subcommand == "export") {
    return run_export(args);
  }
  if (subcommand == "delete") {
    return run_delete(args);
  }
  if (subcommand == "status") {
    return run_status();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace snapseek::cli
