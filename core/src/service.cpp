#include "psguard/service.h"
#include "psguard/env_guard.h"
#include "psguard/json_util.h"
#include "psguard/proc.h"
#include "psguard/serialization.h"
#include "psguard/validate.h"

#include <regex>
#include <sys/stat.h>
#include <thread>
#include <vector>

namespace psguard {

using namespace json_util;

json_object* OpResult::to_json_object() const {
    json_object* o = json_object_new_object();
    add_string(o, "operation", operation);
    add_string(o, "status", success ? "Success" : "Error");
    if (!result_json.empty()) {
        Doc d = parse(result_json);
        json_object_object_add(o, "result", d ? d.release() : new_string(result_json));
    }
    if (error_code != ErrorCode::NONE) {
        add_int(o, "error_code", static_cast<int>(error_code));
        add_string(o, "error_type", error_type_name(error_code));
    }
    if (!message.empty()) add_string(o, "message", message);
    if (validation) json_object_object_add(o, "validation", validation_to_json(*validation));
    return o;
}

std::string OpResult::to_json() const {
    Doc d(to_json_object());
    return json_util::to_string(d.root);
}

// Request fields after extraction, before any guard ran.
struct GuardService::Prepared {
    std::string text;
    std::string working_directory;
    std::map<std::string, std::string> env;
};

GuardService::GuardService(const SecurityPolicy& policy,
                           std::filesystem::path root,
                           const Executor& executor,
                           AuditLogger& audit)
    : policy_(policy), root_(std::move(root)), executor_(executor), audit_(audit) {}

OpResult GuardService::reject(const std::string& operation, const Prepared& p,
                              const ValidationOutcome& v, ErrorCode code) {
    AuditEntry e;
    e.operation = operation;
    e.command_or_script = p.text;
    e.working_directory = p.working_directory;
    e.environment_overrides = p.env;
    e.validation = v;
    e.success = false;
    e.error_code = code;
    audit_.log(e);

    OpResult r;
    r.operation = operation;
    r.error_code = code;
    r.validation = v;
    r.message = (code == ErrorCode::SECURITY ? "security violation: " : "invalid params: ") + v.reason;
    return r;
}

OpResult GuardService::execute(const std::string& operation, json_object* params, bool is_script) {
    const char* text_key = is_script ? "script" : "command";
    Prepared p;
    p.working_directory = get_string(params, "working_directory").value_or("");
    p.env = get_string_map(params, "environment_vars");

    auto text = get_string(params, text_key);
    if (!text) {
        return reject(operation, p,
            ValidationOutcome::fail("invalid_params", std::string(text_key) + " is required"),
            ErrorCode::INVALID_PARAMS);
    }
    p.text = *text;

    const int default_timeout = is_script ? policy_.script_default_timeout_seconds() : policy_.default_timeout_seconds();
    const int max_timeout = is_script ? policy_.script_max_timeout_seconds() : policy_.max_timeout_seconds();
    int timeout = default_timeout;
    if (has_key(params, "timeout")) {
        auto t = get_number_as_int(params, "timeout");
        if (!t) {
            return reject(operation, p,
                ValidationOutcome::fail("invalid_params", "timeout must be a number"),
                ErrorCode::INVALID_PARAMS);
        }
        // clamped, not rejected
        timeout = *t > max_timeout ? max_timeout : static_cast<int>(*t <= 0 ? 0 : *t);
    }

    bool allow_shell = get_bool(params, "allow_shell_access").value_or(is_script);

    ValidationOutcome v = is_script ? validate_script(policy_, p.text)
                                    : validate_command(policy_, p.text, allow_shell);
    if (!v.valid) return reject(operation, p, v, ErrorCode::SECURITY);

    std::filesystem::path cwd;
    v = validate_working_directory(p.working_directory, root_, &cwd);
    if (!v.valid) return reject(operation, p, v, ErrorCode::SECURITY);

    v = validate_environment(p.env);
    if (!v.valid) return reject(operation, p, v, ErrorCode::SECURITY);

    v = validate_timeout(timeout, max_timeout);
    if (!v.valid) return reject(operation, p, v, ErrorCode::SECURITY);

    ExecutionRequest req;
    req.command_or_script = p.text;
    req.is_script = is_script;
    req.timeout_seconds = timeout;
    req.working_directory = cwd.string();
    req.environment_overrides = p.env;
    req.allow_shell_access = allow_shell;
    req.script_name = get_string(params, "script_name").value_or("");

    ExecutionResult res = executor_.run(req);

    ErrorCode code = ErrorCode::NONE;
    std::string message;
    if (res.timed_out) {
        code = ErrorCode::TIMEOUT;
        message = std::string(is_script ? "script" : "command") + " timed out after " +
                  std::to_string(timeout) + " seconds";
    } else if (!res.started) {
        code = ErrorCode::EXECUTION;
        message = "failed to start interpreter: " + res.error;
    } else if (res.exit_code != 0) {
        code = ErrorCode::EXECUTION;
        message = "exited with code " + std::to_string(res.exit_code);
    }

    AuditEntry e;
    e.operation = operation;
    e.command_or_script = p.text;
    e.working_directory = req.working_directory;
    e.environment_overrides = p.env;
    e.result = res;
    e.validation = ValidationOutcome::ok();
    e.duration_ms = res.duration_ms;
    e.success = res.succeeded();
    e.error_code = code;
    audit_.log(e);

    Doc rj(execution_result_to_json(res));
    add_string(rj.root, "working_directory", req.working_directory);
    if (!req.script_name.empty()) add_string(rj.root, "script_name", req.script_name);

    OpResult r;
    r.operation = operation;
    r.success = res.succeeded();
    r.error_code = code;
    r.message = message;
    r.result_json = json_util::to_string(rj.root);
    r.execution = std::move(res);
    return r;
}

OpResult GuardService::execute_command(json_object* params) {
    return execute("execute_command", params, false);
}

OpResult GuardService::execute_script(json_object* params) {
    return execute("execute_script", params, true);
}

OpResult GuardService::check_command_exists(json_object* params) {
    static const std::regex name_re("^[a-zA-Z0-9_.-]+$");
    static const char* const kExtensions[] = {"", ".exe", ".ps1", ".cmd", ".bat"};

    Prepared p;
    auto name = get_string(params, "command");
    if (!name) {
        return reject("check_command_exists", p,
            ValidationOutcome::fail("invalid_params", "command is required"), ErrorCode::INVALID_PARAMS);
    }
    p.text = *name;
    if (!std::regex_match(*name, name_re)) {
        return reject("check_command_exists", p,
            ValidationOutcome::fail("invalid_params", "invalid command name format: " + *name),
            ErrorCode::INVALID_PARAMS);
    }

    bool exists = false;
    std::string path;
    for (const auto& dir : get_array_strings(params, "search_paths")) {
        for (const char* ext : kExtensions) {
            std::string cand = (std::filesystem::path(dir) / (*name + ext)).string();
            struct stat st{};
            if (::stat(cand.c_str(), &st) == 0) {
                exists = true;
                path = cand;
                break;
            }
        }
        if (exists) break;
    }
    if (!exists && (is_builtin_intrinsic(*name) ||
                    (policy_.is_allowed(*name) && name->find('-') != std::string::npos))) {
        exists = true;
        path = "PowerShell: " + *name;
    }
    std::string error;
    if (!exists) {
        path = find_executable(*name);
        exists = !path.empty();
        if (!exists) error = "executable file not found in $PATH";
    }

    AuditEntry e;
    e.operation = "check_command_exists";
    e.command_or_script = *name;
    e.success = exists;
    audit_.log(e);

    Doc rj(json_object_new_object());
    add_bool(rj.root, "exists", exists);
    add_string(rj.root, "command", *name);
    if (!path.empty()) add_string(rj.root, "path", path);
    if (!error.empty()) add_string(rj.root, "error", error);

    OpResult r;
    r.operation = "check_command_exists";
    r.success = true;
    r.result_json = json_util::to_string(rj.root);
    return r;
}

OpResult GuardService::apply_operations(json_object* params) {
    OpResult out;
    out.operation = "apply_operations";

    json_object* ops = member(params, "operations");
    if (!ops || !json_object_is_type(ops, json_type_array)) {
        out.error_code = ErrorCode::INVALID_PARAMS;
        out.message = "operations array is required";
        return out;
    }
    const size_t n = json_object_array_length(ops);
    if (n == 0) {
        out.error_code = ErrorCode::INVALID_PARAMS;
        out.message = "operations array cannot be empty";
        return out;
    }
    const bool parallel = get_bool(params, "parallel").value_or(false);

    // Per-operation params are built up front; workers only read them.
    std::vector<std::string> types(n);
    std::vector<Doc> op_params(n);
    std::vector<OpResult> results(n);
    for (size_t i = 0; i < n; i++) {
        json_object* op = json_object_array_get_idx(ops, i);
        if (!op || !json_object_is_type(op, json_type_object)) {
            results[i].operation = "unknown";
            results[i].message = "Invalid operation format";
            continue;
        }
        auto type = get_string(op, "type");
        if (!type) {
            results[i].operation = "unknown";
            results[i].message = "Operation type is required";
            continue;
        }
        types[i] = *type;

        json_object* nested = member(op, "params");
        if (nested && json_object_is_type(nested, json_type_object)) {
            op_params[i] = Doc(json_object_get(nested));
        } else {
            op_params[i] = Doc(json_object_new_object());
            json_object_object_foreach(op, k, v) {
                if (std::string(k) == "type") continue;
                json_object_object_add(op_params[i].root, k, json_object_get(v));
            }
        }
    }

    auto run_one = [&](size_t i) {
        if (types[i].empty()) return;
        if (types[i] == "apply_operations") {
            results[i].operation = types[i];
            results[i].error_code = ErrorCode::INVALID_PARAMS;
            results[i].message = "nested apply_operations is not allowed";
            return;
        }
        results[i] = handle(types[i], op_params[i].root);
    };

    if (parallel) {
        std::vector<std::thread> workers;
        workers.reserve(n);
        for (size_t i = 0; i < n; i++) workers.emplace_back(run_one, i);
        for (auto& t : workers) t.join();
    } else {
        for (size_t i = 0; i < n; i++) run_one(i);
    }

    Doc rj(json_object_new_object());
    json_object* arr = json_object_new_array();
    for (const auto& r : results) json_object_array_add(arr, r.to_json_object());
    json_object_object_add(rj.root, "results", arr);

    out.success = true;
    out.result_json = json_util::to_string(rj.root);
    return out;
}

OpResult GuardService::handle(const std::string& operation, json_object* params) {
    if (operation == "execute_command") return execute_command(params);
    if (operation == "execute_script") return execute_script(params);
    if (operation == "check_command_exists") return check_command_exists(params);
    if (operation == "apply_operations") return apply_operations(params);

    OpResult r;
    r.operation = operation;
    r.error_code = ErrorCode::INVALID_PARAMS;
    r.message = "unknown operation type: " + operation;
    return r;
}

OpResult GuardService::handle_json(const std::string& operation, const std::string& params_json) {
    Doc d = parse(params_json.empty() ? "{}" : params_json);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        OpResult r;
        r.operation = operation;
        r.error_code = ErrorCode::INVALID_PARAMS;
        r.message = "params must be a JSON object";
        return r;
    }
    return handle(operation, d.root);
}

} // namespace psguard
