#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace psguard {

// Stable error codes surfaced to callers (same values for command and script mode).
enum class ErrorCode : int {
    NONE           = 0,
    SECURITY       = -32001,  // validation or guard rejection; nothing was spawned
    TIMEOUT        = -32002,  // started, killed at the deadline
    EXECUTION      = -32003,  // non-zero exit or failed to start
    INVALID_PARAMS = -32602,
};

// "Security", "Timeout", "Execution", "InvalidParams" ("" for NONE).
const char* error_type_name(ErrorCode c);

// Result of every validator/guard call. `rule` names the policy clause that
// fired; `line` is set for per-line script failures (1-based).
struct ValidationOutcome {
    bool valid{true};
    std::string reason;
    std::string rule;
    std::string pattern;
    int line{0};

    static ValidationOutcome ok() { return ValidationOutcome{}; }
    static ValidationOutcome fail(std::string rule, std::string reason, std::string pattern = "", int line = 0) {
        ValidationOutcome v;
        v.valid = false;
        v.rule = std::move(rule);
        v.reason = std::move(reason);
        v.pattern = std::move(pattern);
        v.line = line;
        return v;
    }
};

struct ExecutionRequest {
    std::string command_or_script;
    bool is_script{false};
    int timeout_seconds{30};
    std::string working_directory;                      // empty: inherit
    std::map<std::string, std::string> environment_overrides;
    bool allow_shell_access{false};
    std::string script_name;                            // informational
};

struct ExecutionResult {
    int exit_code{-1};
    std::string stdout_data;
    std::string stderr_data;
    int64_t duration_ms{0};
    bool timed_out{false};
    std::optional<int> lines_executed;

    bool started{false};          // false: interpreter could not be launched
    bool stdout_truncated{false};
    bool stderr_truncated{false};
    std::string error;            // internal runner error, not child stderr

    bool succeeded() const { return started && !timed_out && exit_code == 0; }
};

} // namespace psguard
