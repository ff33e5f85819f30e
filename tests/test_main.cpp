#include "test_framework.hpp"

#include "cortex/observability/global.hpp"

#include <csignal>
#include <iostream>

void register_identity_tests(std::vector<cortex::tests::TestCase> &tests);
void register_frontmatter_tests(std::vector<cortex::tests::TestCase> &tests);
void register_category_index_tests(std::vector<cortex::tests::TestCase> &tests);
void register_storage_tests(std::vector<cortex::tests::TestCase> &tests);
void register_reindex_tests(std::vector<cortex::tests::TestCase> &tests);
void register_operations_tests(std::vector<cortex::tests::TestCase> &tests);
void register_category_tests(std::vector<cortex::tests::TestCase> &tests);
void register_config_tests(std::vector<cortex::tests::TestCase> &tests);
void register_observability_tests(std::vector<cortex::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<cortex::tests::TestCase> tests;
  register_identity_tests(tests);
  register_frontmatter_tests(tests);
  register_category_index_tests(tests);
  register_storage_tests(tests);
  register_reindex_tests(tests);
  register_operations_tests(tests);
  register_category_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    // Each case starts without a global observer; cases that assert on
    // events install their own.
    cortex::observability::set_global_observer(nullptr);
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }
  cortex::observability::set_global_observer(nullptr);

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
