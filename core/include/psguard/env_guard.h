#pragma once

#include "psguard/types.h"

#include <filesystem>
#include <map>
#include <string>

namespace psguard {

// Working-directory jail. `requested` may be empty (means `root`), relative
// (resolved against `root`) or absolute. Backslashes count as separators.
// On success `*resolved` receives the canonical directory.
//
// Rules: path_traversal, path_restriction, directory_exists, not_directory.
ValidationOutcome validate_working_directory(const std::string& requested,
                                             const std::filesystem::path& root,
                                             std::filesystem::path* resolved);

// Environment overrides: only names are screened, values pass through.
// Rules: env_var_format, dangerous_env_var.
ValidationOutcome validate_environment(const std::map<std::string, std::string>& overrides);

// Rules: timeout_positive, timeout_maximum.
ValidationOutcome validate_timeout(int timeout_seconds, int max_seconds);

// True if canonical(p) equals canonical(root) or lies beneath it.
bool is_path_under(const std::filesystem::path& p, const std::filesystem::path& root);

} // namespace psguard
