#include "psguard/audit.h"
#include "psguard/config.h"
#include "psguard/executor.h"
#include "psguard/json_util.h"
#include "psguard/serialization.h"
#include "psguard/service.h"
#include "psguard/validate.h"

#include <json-c/json.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace psguard;

namespace {

constexpr size_t MAX_STDIN_BYTES = 10ULL * 1024 * 1024;

// Everything a subcommand needs, built from the environment.
struct Runtime {
    GuardConfig cfg;
    SecurityPolicy policy;
    std::unique_ptr<AuditLogger> audit;
    std::unique_ptr<Executor> executor;
    std::unique_ptr<GuardService> service;
};

// Returns false (after printing why) if the policy or audit file is unusable.
bool init_runtime(Runtime* rt) {
    apply_profile_defaults(detect_profile());
    rt->cfg = load_config_from_env();
    try {
        rt->policy = load_policy(rt->cfg);
    } catch (const std::exception& e) {
        std::cerr << "[psguard] " << e.what() << "\n";
        return false;
    }

    rt->audit = std::make_unique<AuditLogger>(rt->cfg.audit);
    std::string err = rt->audit->open();
    if (!err.empty()) {
        std::cerr << "[psguard] audit: " << err << "\n";
        return false;
    }

    rt->executor = std::make_unique<Executor>(
        Interpreter::powershell(rt->policy, rt->cfg.interpreter), rt->cfg.output_max_bytes);
    rt->service = std::make_unique<GuardService>(rt->policy, rt->cfg.root, *rt->executor, *rt->audit);
    return true;
}

int print_result(const OpResult& r) {
    std::cout << r.to_json() << "\n";
    return r.success ? 0 : 1;
}

// Parses [--timeout N] [--cwd DIR] [--shell] starting at argv[first] into params.
bool parse_exec_flags(int argc, char** argv, int first, json_object* params) {
    for (int i = first; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--timeout" && i + 1 < argc) {
            char* end = nullptr;
            long t = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0') {
                std::cerr << "invalid --timeout: " << argv[i] << "\n";
                return false;
            }
            json_util::add_int(params, "timeout", t);
        } else if (a == "--cwd" && i + 1 < argc) {
            json_util::add_string(params, "working_directory", argv[++i]);
        } else if (a == "--shell") {
            json_util::add_bool(params, "allow_shell_access", true);
        } else {
            std::cerr << "unknown option: " << a << "\n";
            return false;
        }
    }
    return true;
}

int cmd_exec(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: psguard_cli exec <command> [--timeout N] [--cwd DIR] [--shell]\n";
        return 2;
    }
    json_util::Doc params(json_object_new_object());
    json_util::add_string(params.root, "command", argv[2]);
    if (!parse_exec_flags(argc, argv, 3, params.root)) return 2;

    Runtime rt;
    if (!init_runtime(&rt)) return 3;
    return print_result(rt.service->execute_command(params.root));
}

int cmd_script(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: psguard_cli script <file> [--timeout N] [--cwd DIR]\n";
        return 2;
    }
    std::ifstream f(argv[2], std::ios::binary);
    if (!f) {
        std::cerr << "cannot read script: " << argv[2] << "\n";
        return 2;
    }
    std::stringstream ss;
    ss << f.rdbuf();

    json_util::Doc params(json_object_new_object());
    json_util::add_string(params.root, "script", ss.str());
    json_util::add_string(params.root, "script_name", argv[2]);
    if (!parse_exec_flags(argc, argv, 3, params.root)) return 2;

    Runtime rt;
    if (!init_runtime(&rt)) return 3;
    return print_result(rt.service->execute_script(params.root));
}

int cmd_check(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: psguard_cli check <name> [search_path...]\n";
        return 2;
    }
    json_util::Doc params(json_object_new_object());
    json_util::add_string(params.root, "command", argv[2]);
    json_object* paths = json_object_new_array();
    for (int i = 3; i < argc; i++) json_object_array_add(paths, json_util::new_string(argv[i]));
    json_object_object_add(params.root, "search_paths", paths);

    Runtime rt;
    if (!init_runtime(&rt)) return 3;
    return print_result(rt.service->check_command_exists(params.root));
}

// Validation only; nothing is executed or audited.
int cmd_validate(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: psguard_cli validate <command> [--shell]\n";
        return 2;
    }
    bool shell = argc > 3 && std::string(argv[3]) == "--shell";

    apply_profile_defaults(detect_profile());
    GuardConfig cfg = load_config_from_env();
    SecurityPolicy policy;
    try {
        policy = load_policy(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[psguard] " << e.what() << "\n";
        return 3;
    }

    ValidationOutcome v = validate_command(policy, argv[2], shell);
    json_util::Doc out(validation_to_json(v));
    std::cout << json_util::to_string(out.root) << "\n";
    return v.valid ? 0 : 1;
}

// Reads {"operations":[...], "parallel":bool} from stdin.
int cmd_batch(int, char**) {
    std::string req;
    char rbuf[8192];
    while (std::cin.read(rbuf, sizeof(rbuf)) || std::cin.gcount()) {
        req.append(rbuf, static_cast<size_t>(std::cin.gcount()));
        if (req.size() > MAX_STDIN_BYTES) {
            std::cerr << "stdin exceeds 10MB limit\n";
            return 5;
        }
    }

    Runtime rt;
    if (!init_runtime(&rt)) return 3;
    return print_result(rt.service->handle_json("apply_operations", req));
}

int cmd_audit_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: psguard_cli audit_verify <file>\n";
        return 2;
    }
    ChainVerifyResult r = verify_audit_chain(argv[2]);
    if (r.ok) {
        std::cout << "audit chain OK (" << r.lines << " lines)\n";
        return 0;
    }
    std::cout << "audit chain BROKEN";
    if (r.bad_line > 0) std::cout << " at line " << r.bad_line;
    std::cout << ": " << r.error << "\n";
    return 1;
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "psguard_cli <exec|script|check|validate|batch|audit_verify> ...\n";
        return 2;
    }
    std::string cmd = argv[1];
    if (cmd == "exec") return cmd_exec(argc, argv);
    if (cmd == "script") return cmd_script(argc, argv);
    if (cmd == "check") return cmd_check(argc, argv);
    if (cmd == "validate") return cmd_validate(argc, argv);
    if (cmd == "batch") return cmd_batch(argc, argv);
    if (cmd == "audit_verify") return cmd_audit_verify(argc, argv);

    std::cerr << "unknown command: " << cmd << "\n";
    return 2;
}
