#include "psguard/config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <system_error>

namespace psguard {

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

static std::string env_or(const char* name, const std::string& def) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : def;
}

Profile detect_profile() {
    const char* env = std::getenv("PSGUARD_PROFILE");
    if (!env) return Profile::DEV;

    std::string val = lower(env);
    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any worker threads are created.
    // setenv() is not thread-safe with getenv() on some platforms.
    constexpr int NO_OVERWRITE = 0;

    switch (p) {
        case Profile::DEV:
            setenv("PSGUARD_AUDIT_FSYNC",         "0",       NO_OVERWRITE);
            setenv("PSGUARD_STDOUT_MAX",          "4194304", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("PSGUARD_AUDIT_FSYNC",         "1",       NO_OVERWRITE);
            setenv("PSGUARD_AUDIT_DISABLED",      "0",       NO_OVERWRITE);
            setenv("PSGUARD_STDOUT_MAX",          "1048576", NO_OVERWRITE);
            setenv("PSGUARD_ALLOW_SHELL_ACCESS",  "0",       NO_OVERWRITE);
            break;
    }
}

bool env_flag(const char* name, bool def) {
    const char* v = std::getenv(name);
    if (!v) return def;
    std::string s = lower(v);
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return def;
}

GuardConfig load_config_from_env() {
    GuardConfig cfg;
    cfg.profile = detect_profile();

    std::string root = env_or("PSGUARD_ROOT", env_or("REPO_PATH", ""));
    std::error_code ec;
    if (root.empty()) {
        cfg.root = std::filesystem::current_path(ec);
    } else {
        cfg.root = std::filesystem::weakly_canonical(root, ec);
        if (ec) cfg.root = root;
    }

    cfg.policy_file = env_or("PSGUARD_POLICY_FILE", "");
    cfg.interpreter = env_or("PSGUARD_INTERPRETER", "");

    cfg.audit.enabled = !env_flag("PSGUARD_AUDIT_DISABLED", false);
    cfg.audit.path = env_or("PSGUARD_AUDIT_FILE", "psguard-audit.log");
    cfg.audit.fsync = env_flag("PSGUARD_AUDIT_FSYNC", true);

    std::string max = env_or("PSGUARD_STDOUT_MAX", "");
    if (!max.empty()) {
        char* end = nullptr;
        unsigned long long v = std::strtoull(max.c_str(), &end, 10);
        if (end && *end == '\0' && v > 0) cfg.output_max_bytes = static_cast<size_t>(v);
    }

    if (std::getenv("PSGUARD_ALLOW_SHELL_ACCESS")) {
        cfg.allow_shell_access = env_flag("PSGUARD_ALLOW_SHELL_ACCESS", false);
    }
    return cfg;
}

SecurityPolicy load_policy(const GuardConfig& cfg) {
    SecurityPolicy base = cfg.policy_file.empty() ? default_policy() : load_policy_file(cfg.policy_file);
    if (!cfg.allow_shell_access) return base;
    return PolicyBuilder(base).allow_shell_access_by_default(*cfg.allow_shell_access).build();
}

} // namespace psguard
