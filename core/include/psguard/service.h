#pragma once

#include "audit.h"
#include "executor.h"
#include "policy.h"
#include "types.h"

#include <json-c/json.h>

#include <filesystem>
#include <optional>
#include <string>

namespace psguard {

// Outcome of one operation, ready to be serialized for the caller.
struct OpResult {
    std::string operation;
    bool success{false};
    std::string result_json;                      // empty: no result payload
    ErrorCode error_code{ErrorCode::NONE};
    std::string message;
    std::optional<ValidationOutcome> validation;  // set on security rejections
    std::optional<ExecutionResult> execution;     // set when the executor ran

    // {"operation","status":"Success"|"Error","result"?,"error_code"?,
    //  "error_type"?,"message"?,"validation"?}
    json_object* to_json_object() const;
    std::string to_json() const;
};

// Operation surface. Wires validators, the path/env guard, the executor and
// the audit logger. All collaborators are borrowed and must outlive the
// service. Safe to call from several threads.
class GuardService {
public:
    GuardService(const SecurityPolicy& policy,
                 std::filesystem::path root,
                 const Executor& executor,
                 AuditLogger& audit);

    // params: command, timeout, working_directory, environment_vars, allow_shell_access
    OpResult execute_command(json_object* params);

    // params: script, timeout, working_directory, environment_vars,
    //         allow_shell_access (default true), script_name
    OpResult execute_script(json_object* params);

    // params: command, search_paths
    OpResult check_command_exists(json_object* params);

    // params: operations: [ {type, ...} ], parallel (default false)
    // result: {"results":[OpResult...]} in request order
    OpResult apply_operations(json_object* params);

    // Dispatch by name. Unknown names yield INVALID_PARAMS.
    OpResult handle(const std::string& operation, json_object* params);
    OpResult handle_json(const std::string& operation, const std::string& params_json);

    const SecurityPolicy& policy() const { return policy_; }
    const std::filesystem::path& root() const { return root_; }

private:
    struct Prepared;

    OpResult execute(const std::string& operation, json_object* params, bool is_script);
    OpResult reject(const std::string& operation, const Prepared& p,
                    const ValidationOutcome& v, ErrorCode code);

    const SecurityPolicy& policy_;
    std::filesystem::path root_;
    const Executor& executor_;
    AuditLogger& audit_;
};

} // namespace psguard
