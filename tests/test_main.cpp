#include "test_framework.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>

void register_common_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_config_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_metrics_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_diagnostics_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_alerts_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_healing_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_journal_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_monitor_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_daemon_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_observability_doctor_tests(std::vector<hostwarden::tests::TestCase> &tests);
void register_agent_integration_tests(std::vector<hostwarden::tests::TestCase> &tests);

// Usage: hostwarden_tests [name-substring]
int main(int argc, char **argv) {
  // Alert notifiers write to pipes that may close early.
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<hostwarden::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_metrics_tests(tests);
  register_diagnostics_tests(tests);
  register_alerts_tests(tests);
  register_healing_tests(tests);
  register_journal_tests(tests);
  register_monitor_tests(tests);
  register_daemon_tests(tests);
  register_observability_doctor_tests(tests);
  register_agent_integration_tests(tests);

  const std::string filter = argc > 1 ? argv[1] : "";
  std::size_t ran = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    if (!filter.empty() && test.name.find(filter) == std::string::npos) {
      continue;
    }
    ++ran;
    const auto started = std::chrono::steady_clock::now();
    try {
      test.fn();
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
      continue;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    if (elapsed > std::chrono::seconds(2)) {
      std::cerr << "[SLOW] " << test.name << ": " << elapsed.count() << "ms\n";
    }
  }

  if (ran == 0) {
    std::cerr << "no test matches '" << filter << "'\n";
    return 1;
  }
  std::cout << "Ran " << ran << " of " << tests.size() << " tests: " << ran - failed
            << " passed, " << failed << " failed\n";
  return failed == 0 ? 0 : 1;
}
