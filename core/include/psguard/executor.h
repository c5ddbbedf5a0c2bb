#pragma once

#include "policy.h"
#include "proc.h"
#include "types.h"

#include <cstddef>
#include <string>
#include <vector>

namespace psguard {

// How to invoke the guarded interpreter.
//   command mode: <program> <command_args...> <command text>
//   script mode:  <program> <script_args...> <temp file path>
struct Interpreter {
    std::string program;
    std::vector<std::string> command_args;
    std::vector<std::string> script_args;
    std::string script_suffix{".ps1"};

    // PowerShell. `cmdline` overrides the program ("pwsh -NoLogo"); empty
    // means pwsh, then powershell, on PATH. Script mode adds
    // "-ExecutionPolicy Bypass" only if the policy allows the override.
    static Interpreter powershell(const SecurityPolicy& policy, const std::string& cmdline = "");
};

// Runs already-validated requests. Holds no mutable state; run() may be
// called concurrently.
class Executor {
public:
    explicit Executor(Interpreter interp, size_t output_max_bytes = 1024 * 1024);

    // Never throws. started=false (with `error`) if the interpreter or the
    // temp script could not be set up. Scripts are written to a unique 0600
    // temp file that is removed before returning.
    ExecutionResult run(const ExecutionRequest& req) const;

    const Interpreter& interpreter() const { return interp_; }

private:
    Interpreter interp_;
    size_t output_max_bytes_;
};

} // namespace psguard
