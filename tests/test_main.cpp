#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_config_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_model_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_watch_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_state_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_sessions_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_gateway_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_observability_health_tests(std::vector<teamlens::tests::TestCase> &tests);
void register_pipeline_integration_tests(std::vector<teamlens::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when a peer socket closes mid-write
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<teamlens::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_model_tests(tests);
  register_watch_tests(tests);
  register_state_tests(tests);
  register_sessions_tests(tests);
  register_gateway_tests(tests);
  register_observability_health_tests(tests);
  register_pipeline_integration_tests(tests);

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
