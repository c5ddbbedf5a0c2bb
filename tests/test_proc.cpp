#include "test_common.h"

#include "psguard/proc.h"

#include <chrono>

using namespace psguard;
namespace fs = std::filesystem;

static std::vector<std::string> sh(const std::string& script) {
    return {"/bin/sh", "-c", script};
}

static std::string trim_nl(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) s.pop_back();
    return s;
}

int main() {
    ProcLimits lim;
    lim.timeout_ms = 5000;

    // Test 1: separate stdout/stderr and exit code
    ProcResult r;
    bool started = proc_run_capture(sh("echo out; echo err 1>&2; exit 3"), "", {}, lim, &r);
    expect_true(started, "sh should start: " + r.error);
    expect_eq_ll(r.exit_code, 3, "exit code");
    expect_eq_str(r.stdout_data, "out\n", "stdout captured");
    expect_eq_str(r.stderr_data, "err\n", "stderr captured separately");
    expect_true(!r.timed_out, "no timeout");

    // Test 2: PATH lookup for a bare program name
    started = proc_run_capture({"sh", "-c", "exit 0"}, "", {}, lim, &r);
    expect_true(started, "bare name resolved on PATH");
    expect_eq_ll(r.exit_code, 0, "exit 0");
    expect_true(!find_executable("sh").empty(), "find_executable(sh)");
    expect_true(find_executable("psguard-no-such-tool").empty(), "unknown tool not found");

    // Test 3: environment overrides are merged, not replacing
    started = proc_run_capture(sh("echo \"$PSG_TEST_VAR:$PATH\""), "",
                               {{"PSG_TEST_VAR", "hello world"}}, lim, &r);
    expect_true(started, "env run started");
    expect_true(r.stdout_data.rfind("hello world:", 0) == 0, "override visible: " + r.stdout_data);
    expect_true(trim_nl(r.stdout_data).size() > std::string("hello world:").size(), "inherited PATH kept");

    // Test 4: working directory
    fs::path dir = make_test_dir("psguard_test_proc");
    started = proc_run_capture(sh("pwd -P"), dir.string(), {}, lim, &r);
    expect_true(started, "cwd run started");
    expect_eq_str(trim_nl(r.stdout_data), dir.string(), "child runs in cwd");

    // Test 5: failures to start are reported, not run
    started = proc_run_capture({"/nonexistent/psguard/bin"}, "", {}, lim, &r);
    expect_true(!started, "missing program does not start");
    expect_true(!r.error.empty(), "missing program has an error");

    started = proc_run_capture(sh("echo should-not-run"), (dir / "missing").string(), {}, lim, &r);
    expect_true(!started, "bad cwd does not start");
    expect_true(r.error.find("chdir") != std::string::npos, "bad cwd reported as chdir: " + r.error);
    expect_true(r.stdout_data.empty(), "nothing ran in bad cwd");

    started = proc_run_capture({}, "", {}, lim, &r);
    expect_true(!started, "empty argv refused");

    // Test 6: timeout kills the whole group and keeps partial output
    ProcLimits quick;
    quick.timeout_ms = 1000;
    auto t0 = std::chrono::steady_clock::now();
    started = proc_run_capture(sh("echo partial; sleep 5 & sleep 5; echo never"), "", {}, quick, &r);
    auto wall = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
    expect_true(started, "timeout run started");
    expect_true(r.timed_out, "timed out");
    expect_eq_str(r.stdout_data, "partial\n", "partial output preserved");
    expect_true(r.duration_ms >= 1000, "duration at least the deadline");
    expect_true(r.duration_ms < 2500, "duration within margin: " + std::to_string(r.duration_ms));
    expect_true(wall < 2500, "caller not blocked past margin: " + std::to_string(wall));

    // Test 7: output cap
    ProcLimits capped;
    capped.timeout_ms = 5000;
    capped.stdout_max_bytes = 100;
    started = proc_run_capture(sh("head -c 100000 /dev/zero | tr '\\0' x"), "", {}, capped, &r);
    expect_true(started, "cap run started");
    expect_eq_ll(static_cast<long long>(r.stdout_data.size()), 100, "stdout capped");
    expect_true(r.stdout_truncated, "truncation flagged");
    expect_true(!r.stderr_truncated, "stderr not truncated");
    expect_eq_ll(r.exit_code, 0, "child not blocked by the cap");

    // Test 8: argv splitting
    auto toks = split_argv_quoted("pwsh -NoLogo \"-Command\" 'a b' c\\ d");
    expect_eq_ll(static_cast<long long>(toks.size()), 6, "token count");
    expect_eq_str(toks[0], "pwsh", "tok0");
    expect_eq_str(toks[2], "-Command", "double quotes removed");
    expect_eq_str(toks[3], "a b", "single-quoted token");
    expect_true(split_argv_quoted("\"unterminated").empty(), "unterminated quote");

    std::error_code ec;
    fs::remove_all(dir, ec);

    std::cerr << "test_proc: ALL PASSED" << std::endl;
    return 0;
}
