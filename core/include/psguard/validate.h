#pragma once

#include "psguard/policy.h"
#include "psguard/types.h"

#include <string>

namespace psguard {

// Heuristic PowerShell validators. These reason about text with regexes, not
// a grammar: string-built or otherwise obfuscated invocations can evade them.
// Treat them as one layer, not as a sandbox.

// Known-safe read-only cmdlets accepted even when absent from the allow-list.
bool is_builtin_intrinsic(const std::string& name);

// First token of a command line, or "" when the line does not name a command
// (empty, variable reference, bare parameter, assignment).
std::string extract_base_command(const std::string& line);

// Pipeline, redirection, separators, call operator, subexpressions,
// grouping, script blocks, array expressions.
bool contains_shell_features(const std::string& line);

// Control flow, declarations and assignments: lines that do not themselves
// invoke an external command.
bool is_control_structure(const std::string& line);

// First rule of the given scope matching `text`, or nullptr.
const Rule* match_rule(const SecurityPolicy& policy, const std::string& text, const RuleScope* scope);

ValidationOutcome validate_command(const SecurityPolicy& policy,
                                   const std::string& command,
                                   bool allow_shell_access);

ValidationOutcome validate_script(const SecurityPolicy& policy,
                                  const std::string& script);

} // namespace psguard
