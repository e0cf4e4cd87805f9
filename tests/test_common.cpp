#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "hostwarden/common/cancellation.hpp"
#include "hostwarden/common/fs.hpp"
#include "hostwarden/common/json_util.hpp"
#include "hostwarden/common/process.hpp"
#include "hostwarden/common/toml.hpp"

#include <chrono>
#include <thread>

void register_common_tests(std::vector<hostwarden::tests::TestCase> &tests) {
  using hostwarden::tests::require;
  namespace common = hostwarden::common;
  namespace ht = hostwarden::testing;

  tests.push_back({"common_string_helpers", [] {
                     require(common::trim("  a b \n") == "a b", "trim mismatch");
                     require(common::to_lower("MiXeD") == "mixed", "to_lower mismatch");
                     const auto parts = common::split("a, b,,c", ',');
                     require(parts.size() == 3 && parts[1] == "b" && parts[2] == "c",
                             "split should trim and drop empty parts");
                     require(common::join({"x", "y"}, ", ") == "x, y", "join mismatch");
                   }});

  tests.push_back({"common_is_subpath_matches_components", [] {
                     require(common::is_subpath("/var/log/app", "/var/log"), "child not detected");
                     require(common::is_subpath("/var/log", "/var/log/"), "equal not detected");
                     require(!common::is_subpath("/var/logs", "/var/log"),
                             "prefix without separator matched");
                     require(!common::is_subpath("/var", "/var/log"), "parent matched as child");
                   }});

  tests.push_back({"common_atomic_write_and_read", [] {
                     ht::TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "file.txt";
                     require(common::ensure_dir(path.parent_path()).ok(), "ensure_dir failed");
                     require(common::write_file_atomic(path, "first").ok(), "first write failed");
                     require(common::write_file_atomic(path, "second").ok(), "second write failed");
                     const auto content = common::read_file(path);
                     require(content.ok() && content.value() == "second", "content mismatch");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temporary file left behind");
                     require(!common::read_file(workspace.path() / "missing").ok(),
                             "missing file should fail");
                   }});

  tests.push_back({"common_find_executable_searches_path", [] {
                     const auto sh = common::find_executable("sh");
                     require(sh.has_value(), "sh not found on PATH");
                     require(!common::find_executable("hostwarden-no-such-tool").has_value(),
                             "bogus tool found");
                   }});

  tests.push_back({"common_run_process_captures_output_and_stdin", [] {
                     auto result = common::run_process(
                         {"cat"}, common::ProcessOptions{.timeout = std::chrono::seconds(5),
                                                         .stdin_data = "hello"});
                     require(result.ok(), result.error());
                     require(result.value().exit_code == 0, "cat exit code");
                     require(result.value().stdout_text == "hello", "stdin not forwarded");

                     auto failing = common::run_process({"sh", "-c", "echo oops >&2; exit 3"});
                     require(failing.ok(), failing.error());
                     require(failing.value().exit_code == 3, "exit code not propagated");
                     require(common::trim(failing.value().stderr_text) == "oops",
                             "stderr not captured");
                   }});

  tests.push_back({"common_run_process_times_out", [] {
                     const auto started = std::chrono::steady_clock::now();
                     auto result = common::run_process(
                         {"sleep", "10"},
                         common::ProcessOptions{.timeout = std::chrono::milliseconds(200)});
                     require(result.ok(), result.error());
                     require(result.value().timed_out, "timeout not reported");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                             "timeout did not kill the child");
                   }});

  tests.push_back({"common_run_process_timeout_sends_sigterm_first", [] {
                     auto graceful = common::run_process(
                         {"sh", "-c", "trap 'echo terminated; exit 0' TERM; sleep 10 & wait"},
                         common::ProcessOptions{.timeout = std::chrono::milliseconds(200)});
                     require(graceful.ok(), graceful.error());
                     require(graceful.value().timed_out, "timeout not reported");
                     require(common::trim(graceful.value().stdout_text) == "terminated",
                             "child should see SIGTERM before SIGKILL");

                     const auto started = std::chrono::steady_clock::now();
                     auto stubborn = common::run_process(
                         {"sh", "-c", "trap '' TERM; sleep 10"},
                         common::ProcessOptions{.timeout = std::chrono::milliseconds(200),
                                                .term_grace = std::chrono::milliseconds(200)});
                     require(stubborn.ok(), stubborn.error());
                     require(stubborn.value().timed_out, "timeout not reported");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                             "SIGKILL did not follow an ignored SIGTERM");
                   }});

  tests.push_back({"common_run_process_missing_program_fails", [] {
                     auto result = common::run_process({"hostwarden-no-such-tool"});
                     require(!result.ok(), "missing program should fail to start");
                     require(!common::run_process({}).ok(), "empty argv should fail");
                   }});

  tests.push_back({"common_cancellation_wakes_waiter", [] {
                     common::CancellationToken token;
                     require(token.wait_for(std::chrono::milliseconds(10)),
                             "uncancelled wait should report a full sleep");
                     std::thread canceller([&token] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(50));
                       token.cancel();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const bool slept = token.wait_for(std::chrono::seconds(30));
                     canceller.join();
                     require(!slept, "cancel should interrupt the wait");
                     require(token.cancelled(), "token should stay cancelled");
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(10),
                             "wait was not interrupted promptly");
                   }});

  tests.push_back({"common_toml_sections_and_arrays", [] {
                     const auto doc = common::parse_toml(
                         "monitor_interval_secs = 30\n"
                         "[alerts]\n"
                         "recipient = \"ops@example.com\" # inline comment\n"
                         "[self_heal]\n"
                         "command_prefix = [\"sudo\", \"-n\"]\n"
                         "excluded_pids = [42, 43]\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_int("monitor_interval_secs", 0) == 30, "int mismatch");
                     require(doc.value().get_string("alerts.recipient") == "ops@example.com",
                             "string mismatch");
                     const auto prefix = doc.value().get_string_array("self_heal.command_prefix");
                     require(prefix.size() == 2 && prefix[0] == "sudo", "array mismatch");
                     const auto pids = doc.value().get_int_array("self_heal.excluded_pids");
                     require(pids.size() == 2 && pids[1] == 43, "int array mismatch");
                   }});

  tests.push_back({"common_toml_rejects_duplicates_and_bad_types", [] {
                     require(!common::parse_toml("a = 1\na = 2\n").ok(), "duplicate accepted");
                     const auto doc = common::parse_toml("flag = \"maybe\"\n");
                     require(doc.ok(), doc.error());
                     require(!doc.value().read_bool("flag").ok(), "bad bool accepted");
                   }});

  tests.push_back({"common_json_quote_escapes", [] {
                     require(common::json_quote("a\"b\n") == "\"a\\\"b\\n\"", "escape mismatch");
                   }});
}
