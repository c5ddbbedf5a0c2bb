#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace psguard {

struct ProcLimits {
    int timeout_ms{30000};              // <= 0: no deadline
    size_t stdout_max_bytes{1024 * 1024};
    size_t stderr_max_bytes{1024 * 1024};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string stdout_data;
    std::string stderr_data;
    int64_t duration_ms{0};
    std::string error; // internal runner error, not child stderr
};

// Run argv (argv[0] resolved against PATH when it has no '/') in its own
// process group with stdin bound to /dev/null. `env_overrides` are merged
// into the inherited environment, replacing same-named entries. stdout and
// stderr are captured separately. On deadline expiry the whole group is
// SIGKILLed, timed_out is set and partial output kept.
//
// Returns true if the process started (exec succeeded). On false,
// res->error says why and nothing ran.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::map<std::string, std::string>& env_overrides,
                      const ProcLimits& lim,
                      ProcResult* res);

// Absolute path of an executable found on PATH (or `search_path` when not
// empty, ':'-separated). Empty if not found.
std::string find_executable(const std::string& name, const std::string& search_path = "");

// Split a command string into argv tokens. Supports single/double quotes and
// backslash escapes inside double quotes. Empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace psguard
