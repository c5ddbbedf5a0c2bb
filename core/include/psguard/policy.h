#pragma once

#include <regex>
#include <set>
#include <string>
#include <vector>

namespace psguard {

// Where a rule is meaningful.
//   STATEMENT: a single command line (checked per command and per script line).
//   COMPOSITE: multi-token or cross-line constructs (checked against the whole
//              script, and against single commands).
enum class RuleScope { STATEMENT, COMPOSITE };

const char* rule_scope_name(RuleScope s);

// One entry of the ordered blocked-pattern table. `pattern` is kept verbatim
// for audit/reporting; `re` is the compiled case-insensitive form.
struct Rule {
    std::string pattern;
    std::string name;
    std::string rationale;
    RuleScope scope{RuleScope::STATEMENT};
    std::regex re;
};

// Compile a rule. Throws std::runtime_error on an invalid regex.
Rule make_rule(const std::string& pattern, const std::string& name,
               const std::string& rationale, RuleScope scope);

// Immutable security policy. Build it once at startup (default_policy() or
// load_policy_file()) and share it by const reference.
class SecurityPolicy {
public:
    SecurityPolicy() = default;

    const std::set<std::string>& allowed_commands() const { return allowed_; }
    bool is_allowed(const std::string& base_cmd) const { return allowed_.count(base_cmd) > 0; }

    const std::vector<Rule>& rules() const { return rules_; }

    int max_command_length() const { return max_command_len_; }
    int max_script_length() const { return max_script_len_; }
    int default_timeout_seconds() const { return default_timeout_; }
    int max_timeout_seconds() const { return max_timeout_; }
    int script_default_timeout_seconds() const { return script_default_timeout_; }
    int script_max_timeout_seconds() const { return script_max_timeout_; }
    bool allow_shell_access_by_default() const { return allow_shell_access_; }
    bool allow_execution_policy_override() const { return allow_exec_policy_override_; }

private:
    friend class PolicyBuilder;

    std::set<std::string> allowed_;
    std::vector<Rule> rules_;
    int max_command_len_{1000};
    int max_script_len_{10000};
    int default_timeout_{30};
    int max_timeout_{300};
    int script_default_timeout_{60};
    int script_max_timeout_{600};
    bool allow_shell_access_{false};
    bool allow_exec_policy_override_{false};
};

// Mutable staging area for a SecurityPolicy. build() checks the invariants
// and throws std::runtime_error if they do not hold.
class PolicyBuilder {
public:
    // Starts from the built-in defaults.
    PolicyBuilder();
    // Starts from an existing policy (e.g. to overlay environment settings).
    explicit PolicyBuilder(const SecurityPolicy& base) : p_(base) {}

    PolicyBuilder& clear_allowed_commands();
    PolicyBuilder& allow_command(const std::string& name);
    PolicyBuilder& clear_rules();
    PolicyBuilder& add_rule(const std::string& pattern, const std::string& name,
                            const std::string& rationale, RuleScope scope);
    PolicyBuilder& max_command_length(int n);
    PolicyBuilder& max_script_length(int n);
    PolicyBuilder& timeouts(int default_sec, int max_sec);
    PolicyBuilder& script_timeouts(int default_sec, int max_sec);
    PolicyBuilder& allow_shell_access_by_default(bool v);
    PolicyBuilder& allow_execution_policy_override(bool v);

    SecurityPolicy build() const;

private:
    SecurityPolicy p_;
};

// Built-in policy.
SecurityPolicy default_policy();

// Load a JSON policy file on top of the built-in defaults.
// Throws std::runtime_error if the file is unreadable or malformed.
SecurityPolicy load_policy_file(const std::string& path);

// Same as load_policy_file, from an in-memory JSON document.
SecurityPolicy load_policy_json(const std::string& json);

} // namespace psguard
