#pragma once

#include "audit.h"
#include "policy.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace psguard {

enum class Profile { DEV, PROD };

// Detect profile from PSGUARD_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: no audit fsync, generous output cap
// PROD: audit fsync on, shell composition off, tight output cap
void apply_profile_defaults(Profile p);

// "1", "true", "yes", "on" / "0", "false", "no", "off" (case-insensitive).
// Anything else, or unset, yields `def`.
bool env_flag(const char* name, bool def);

struct GuardConfig {
    Profile profile{Profile::DEV};
    std::filesystem::path root;           // working-directory jail
    std::string policy_file;              // empty: built-in policy
    AuditConfig audit;
    std::string interpreter;              // empty: pwsh, then powershell
    size_t output_max_bytes{1024 * 1024}; // per stream
    std::optional<bool> allow_shell_access;
};

// Reads PSGUARD_* (and REPO_PATH as a root fallback). Call
// apply_profile_defaults() first if profile defaults should apply.
GuardConfig load_config_from_env();

// Policy file (or built-in defaults) with environment overrides applied.
// Throws std::runtime_error on a malformed policy.
SecurityPolicy load_policy(const GuardConfig& cfg);

} // namespace psguard
