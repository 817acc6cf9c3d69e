#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_codec_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_ranker_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_models_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_storage_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_config_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_observability_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_pipeline_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_cli_tests(std::vector<snapseek::tests::TestCase> &tests);
void register_end_to_end_tests(std::vector<snapseek::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<snapseek::tests::TestCase> tests;
  register_codec_tests(tests);
  register_ranker_tests(tests);
  register_models_tests(tests);
  register_storage_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_pipeline_tests(tests);
  register_cli_tests(tests);
  register_end_to_end_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
