#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "snapseek/cli/commands.hpp"
#include "snapseek/config/config.hpp"

#include <filesystem>

namespace {

namespace cli = snapseek::cli;
namespace st = snapseek::testing;
using snapseek::common::ErrorKind;

int run(std::vector<std::string> args) {
  args.insert(args.begin(), "snapseek");
  std::vector<char *> argv;
  argv.reserve(args.size() + 1);
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  const int code = cli::run_cli(static_cast<int>(args.size()), argv.data());
  snapseek::config::clear_config_path_override();
  return code;
}

std::filesystem::path write_cli_config(const st::TempWorkspace &workspace) {
  workspace.create_file("config.toml", "[storage]\n"
                                       "data_dir = \"" +
                                           workspace.path().string() +
                                           "\"\n"
                                           "\n[embedding]\n"
                                           "dimensions = 64\n"
                                           "\n[observability]\n"
                                           "backend = \"none\"\n");
  return workspace.path() / "config.toml";
}

} // namespace

void register_cli_tests(std::vector<snapseek::tests::TestCase> &tests) {
  using snapseek::tests::require;

  tests.push_back({"cli_exit_codes_by_error_kind", [] {
                     require(cli::exit_code_for(ErrorKind::None) == 0, "ok");
                     require(cli::exit_code_for(ErrorKind::Validation) == 2, "validation");
                     require(cli::exit_code_for(ErrorKind::InvalidImage) == 2, "invalid image");
                     require(cli::exit_code_for(ErrorKind::ModelFailure) == 3, "model");
                     require(cli::exit_code_for(ErrorKind::Storage) == 4, "storage");
                     require(cli::exit_code_for(ErrorKind::CorruptVector) == 4, "corrupt");
                     require(cli::exit_code_for(ErrorKind::NotFound) == 5, "not found");
                     require(cli::exit_code_for(ErrorKind::Configuration) == 1, "config");
                   }});

  tests.push_back({"cli_content_type_from_extension", [] {
                     require(cli::content_type_for_extension("JPG") == "image/jpeg", "jpg");
                     require(cli::content_type_for_extension("jpeg") == "image/jpeg", "jpeg");
                     require(cli::content_type_for_extension("png") == "image/png", "png");
                     require(cli::content_type_for_extension("txt") == "application/octet-stream",
                             "unknown");
                     require(cli::content_type_for_extension("") == "application/octet-stream",
                             "empty");
                   }});

  tests.push_back({"cli_search_json_shape", [] {
                     snapseek::pipeline::SearchResponse response;
                     response.query = "red \"car\"";
                     response.total_results = 1;
                     response.results.push_back(snapseek::pipeline::SearchHit{
                         .id = 12,
                         .filename = "abc.jpg",
                         .original_filename = "car.jpg",
                         .caption = "a red car",
                         .created_at = "2026-01-02T03:04:05Z",
                         .size_bytes = 2048,
                         .content_type = "image/jpeg",
                         .score = 0.8,
                     });
                     const std::string json = cli::search_response_to_json(response);
                     require(json == "{\"query\":\"red \\\"car\\\"\",\"total_results\":1,"
                                     "\"results\":[{\"id\":12,\"filename\":\"abc.jpg\","
                                     "\"caption\":\"a red car\","
                                     "\"upload_time\":\"2026-01-02T03:04:05Z\","
                                     "\"file_size\":2048,\"content_type\":\"image/jpeg\","
                                     "\"similarity_score\":0.8000}]}",
                             json);
                   }});

  tests.push_back({"cli_basic_commands", [] {
                     require(run({"version"}) == 0, "version");
                     require(run({"help"}) == 0, "help");
                     require(run({"frobnicate"}) == 1, "unknown command");
                     require(run({"--config"}) == 1, "missing --config value");
                   }});

  tests.push_back({"cli_rejects_bad_arguments", [] {
                     st::TempWorkspace workspace;
                     const auto config = write_cli_config(workspace).string();
                     require(run({"--config", config, "show", "abc"}) == 2, "non-numeric id");
                     require(run({"--config", config, "show"}) == 2, "missing id");
                     require(run({"--config", config, "ingest"}) == 2, "missing file");
                     require(run({"--config", config, "search", "cat", "--limit", "-3"}) == 2,
                             "negative limit");
                   }});

  tests.push_back({"cli_ingest_search_show_delete", [] {
                     st::TempWorkspace workspace;
                     const auto config = write_cli_config(workspace).string();
                     workspace.create_file("blue.png", st::solid_image(40, 40, 0, 0, 255, "png"));
                     workspace.create_file("notes.txt", "plain text");
                     const auto image = (workspace.path() / "blue.png").string();
                     const auto text = (workspace.path() / "notes.txt").string();

                     require(run({"--config", config, "ingest", image}) == 0, "ingest");
                     require(run({"--config", config, "ingest", text}) == 2, "text rejected");
                     require(st::count_files(workspace.path() / "uploads") == 1,
                             "one stored upload");
                     require(run({"--config=" + config, "search", "blue", "image", "--json"}) == 0,
                             "search");
                     require(run({"--config", config, "history"}) == 0, "history");
                     require(run({"--config", config, "show", "1"}) == 0, "show");
                     require(run({"--config", config, "show", "99"}) == 5, "unknown id");
                     require(run({"--config", config, "status"}) == 0, "status");
                     require(run({"--config", config, "delete", "1"}) == 0, "delete");
                     require(run({"--config", config, "delete", "1"}) == 5, "already deleted");
                     require(st::count_files(workspace.path() / "uploads") == 0,
                             "upload removed with its record");
                   }});

  tests.push_back({"cli_config_init_and_validate", [] {
                     st::TempWorkspace workspace;
                     const auto path = (workspace.path() / "conf" / "config.toml").string();
                     require(run({"--config", path, "config", "init"}) == 0, "init");
                     require(std::filesystem::exists(path), "file written");
                     require(run({"--config", path, "config", "init"}) == 1, "refuses overwrite");
                     require(run({"--config", path, "config", "init", "--force"}) == 0, "force");
                     require(run({"--config", path, "config", "validate"}) == 0, "validate");
                     require(run({"--config", path, "config", "show"}) == 0, "show");
                   }});
}
