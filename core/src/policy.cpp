#include "psguard/policy.h"
#include "psguard/json_util.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace psguard {

namespace {

struct RuleSeed {
    const char* pattern;
    const char* name;
    const char* rationale;
    RuleScope scope;
};

// Ordered: first match wins. Statement rules first so that plain single-line
// misuse reports the narrower rule name.
const RuleSeed kDefaultRules[] = {
    // ---- statement scope ----
    {R"(Remove-Item\b.*-Recurse\b.*-Force\b.*[C-Z]:\\)", "recursive_drive_delete",
     "recursive forced deletion rooted at a drive", RuleScope::STATEMENT},
    {R"(\b(Format-Volume|Clear-Disk|Remove-Partition|Initialize-Disk)\b)", "disk_destruction",
     "formats or wipes a disk or partition", RuleScope::STATEMENT},
    {R"(\bformat(\.com|\.exe)?\s+[A-Z]:)", "disk_format",
     "legacy drive format", RuleScope::STATEMENT},
    {R"(\bdiskpart(\.exe)?\b)", "disk_partitioning",
     "interactive partition editor", RuleScope::STATEMENT},
    {R"(\b(Stop-Computer|Restart-Computer)\b)", "system_power",
     "shuts down or reboots the host", RuleScope::STATEMENT},
    {R"(\b(Set-ADUser|Set-LocalUser)\b)", "account_change",
     "modifies user accounts", RuleScope::STATEMENT},
    {R"(\bnet(\.exe)?\s+user\b.*/delete)", "account_delete",
     "deletes user accounts", RuleScope::STATEMENT},
    {R"(\bnet(\.exe)?\s+share\b.*/delete)", "share_delete",
     "removes network shares", RuleScope::STATEMENT},
    {R"(\b(Set-Acl|Take-Ownership|takeown(\.exe)?)\b)", "permission_change",
     "changes ACLs or ownership", RuleScope::STATEMENT},
    {R"(\breg(\.exe)?\s+delete\b)", "registry_delete",
     "deletes registry keys", RuleScope::STATEMENT},
    {R"(\breg(\.exe)?\s+add\b.*/f\b)", "registry_force_add",
     "forced registry writes", RuleScope::STATEMENT},
    {R"(\bschtasks(\.exe)?\b.*/delete)", "task_delete",
     "deletes scheduled tasks", RuleScope::STATEMENT},
    {R"(\bwevtutil(\.exe)?\b.*\bcl\b)", "log_clearing",
     "clears event logs", RuleScope::STATEMENT},
    {R"(\bcipher(\.exe)?\s+/w)", "disk_wipe",
     "wipes free space", RuleScope::STATEMENT},
    {R"(\bsdelete(64)?(\.exe)?\b.*-z\b)", "disk_wipe_sdelete",
     "wipes free space", RuleScope::STATEMENT},
    {R"(\bSet-Service\b.*-Status\s+Stopped)", "service_stop",
     "stops system services", RuleScope::STATEMENT},
    {R"(\bsc(\.exe)?\s+delete\b)", "service_delete",
     "deletes services", RuleScope::STATEMENT},
    {R"(\bshutdown(\.exe)?\b.*/[sr]\b.*/f\b)", "forced_shutdown",
     "forced shutdown or reboot", RuleScope::STATEMENT},
    {R"(\bnet(\.exe)?\s+stop\b.*/y\b)", "forced_service_stop",
     "forced service stop", RuleScope::STATEMENT},

    // ---- composite scope ----
    {R"(\b(Invoke-Expression|iex)\b)", "dynamic_evaluation",
     "evaluates arbitrary strings as code", RuleScope::COMPOSITE},
    {R"(\[ScriptBlock\]\s*::\s*Create)", "dynamic_scriptblock",
     "builds code from strings", RuleScope::COMPOSITE},
    {R"(\bInvoke-Command\b.*-ComputerName\b.*-ScriptBlock)", "remote_execution",
     "runs code on other hosts", RuleScope::COMPOSITE},
    {R"(\bStart-Process\b.*-Verb\s+RunAs)", "elevation",
     "requests elevated privileges", RuleScope::COMPOSITE},
    {R"(\bAdd-Type\b)", "assembly_compile",
     "compiles or loads .NET code", RuleScope::COMPOSITE},
    {R"(System\.Reflection|Reflection\.Assembly)", "reflection",
     "loads assemblies or invokes members by reflection", RuleScope::COMPOSITE},
    {R"(New-Object\b[\s\S]*Net\.WebClient[\s\S]*\.Download(String|File|Data))", "download_cradle",
     "downloads remote content for execution", RuleScope::COMPOSITE},
    {R"(FromBase64String[\s\S]*(\.Invoke\s*\(|Invoke-Command|&\s*\())", "obfuscated_payload",
     "decodes and invokes a hidden payload", RuleScope::COMPOSITE},
    {R"(\bSet-ExecutionPolicy\b.*(Bypass|Unrestricted|-Force))", "execution_policy_change",
     "weakens the script execution policy", RuleScope::COMPOSITE},
    {R"(\bUnblock-File\b.*-Force)", "unblock_file",
     "removes downloaded-file protection", RuleScope::COMPOSITE},
    {R"(\b(Enable-PSRemoting|Set-WSManQuickConfig|Register-PSSessionConfiguration)\b)", "remoting_enable",
     "opens the host to remote management", RuleScope::COMPOSITE},
    {R"(\b(New-Service|Remove-Service)\b|\bSet-Service\b.*-Status\s+(Running|Start))", "service_control",
     "creates, removes or starts services", RuleScope::COMPOSITE},
    {R"(\b(New-LocalUser|Remove-LocalUser|Add-LocalGroupMember|Remove-LocalGroupMember)\b)", "user_management",
     "creates or removes local users or group memberships", RuleScope::COMPOSITE},
    {R"(\b(New-ScheduledTask|Register-ScheduledTask)\b|\bUnregister-ScheduledTask\b.*-Force)", "scheduled_task",
     "persistence through scheduled tasks", RuleScope::COMPOSITE},
    {R"(\b(Set-Content|Get-Content)\b.*-Stream\b)", "alternate_data_stream",
     "hides data in alternate streams", RuleScope::COMPOSITE},
    {R"(\b(Import-Clixml|Export-Clixml)\b)", "clixml_serialization",
     "object (de)serialization", RuleScope::COMPOSITE},
    {R"(\b(ConvertTo-SecureString|ConvertFrom-SecureString)\b.*-AsPlainText|\bGet-Credential\b.*-Store)", "credential_exposure",
     "handles credentials in plain text", RuleScope::COMPOSITE},
    {R"(\b(Remove-PSDrive|Clear-RecycleBin)\b.*-Force)", "forced_cleanup",
     "forced removal of drives or recycle bin", RuleScope::COMPOSITE},
    {R"(\b(Update-HostedCache|Clear-HostedCache)\b)", "hosted_cache",
     "BranchCache manipulation", RuleScope::COMPOSITE},
    {R"(\b(powershell|pwsh)(\.exe)?\b.*\s-e(c|nc\w*)?\b)", "encoded_invocation",
     "nested interpreter with an encoded command", RuleScope::COMPOSITE},
    {R"(\b(powershell|pwsh)(\.exe)?\b.*-WindowStyle\s+Hidden)", "hidden_invocation",
     "nested interpreter with a hidden window", RuleScope::COMPOSITE},
};

const char* const kDefaultAllowed[] = {
    // file operations
    "Get-ChildItem", "Get-Content", "Set-Content", "Add-Content", "Get-Item", "Test-Path",
    "New-Item", "Remove-Item", "Copy-Item", "Move-Item", "Rename-Item", "Get-Location",
    "Set-Location", "Get-Date", "Get-Host", "Write-Host", "Write-Output", "Out-File", "Out-String",
    // development tools
    "git", "npm", "yarn", "dotnet", "msbuild", "go", "python", "python3", "node",
    "java", "javac", "mvn", "gradle", "cargo", "rustc", "gcc", "g++", "clang", "clang++",
    "choco", "winget",
    // system information
    "Get-Process", "Get-Service", "Get-ComputerInfo", "Get-WmiObject", "Get-CimInstance",
    "Get-Variable", "Get-Module", "Get-Command",
    // text processing
    "Select-String", "Select-Object", "Where-Object", "ForEach-Object", "Sort-Object",
    "Group-Object", "Measure-Object", "Compare-Object", "Join-String",
    // archives
    "Compress-Archive", "Expand-Archive", "tar", "zip",
    // network (read-only)
    "Test-Connection", "Test-NetConnection", "Resolve-DnsName", "Invoke-WebRequest",
    "Invoke-RestMethod", "curl", "wget",
    // process management
    "Stop-Process", "Start-Process", "Wait-Process", "Start-Sleep",
    // cmd.exe style
    "dir", "type", "copy", "move", "del", "md", "rd", "cls", "echo", "cd",
    "whoami", "hostname", "ipconfig", "netstat", "tasklist", "taskkill",
};

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open policy file: " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

RuleScope parse_scope(const std::string& s) {
    if (s.empty() || s == "statement") return RuleScope::STATEMENT;
    if (s == "composite") return RuleScope::COMPOSITE;
    throw std::runtime_error("policy: unknown rule scope: " + s);
}

int read_positive(json_object* root, const char* key, int current) {
    if (!json_util::has_key(root, key)) return current;
    auto v = json_util::get_number_as_int(root, key);
    if (!v || *v <= 0 || *v > 1000000000) {
        throw std::runtime_error(std::string("policy: ") + key + " must be a positive integer");
    }
    return static_cast<int>(*v);
}

bool read_flag(json_object* root, const char* key, bool current) {
    if (!json_util::has_key(root, key)) return current;
    auto v = json_util::get_bool(root, key);
    if (!v) throw std::runtime_error(std::string("policy: ") + key + " must be a boolean");
    return *v;
}

} // namespace

const char* rule_scope_name(RuleScope s) {
    switch (s) {
        case RuleScope::STATEMENT: return "statement";
        case RuleScope::COMPOSITE: return "composite";
    }
    return "statement";
}

Rule make_rule(const std::string& pattern, const std::string& name,
               const std::string& rationale, RuleScope scope) {
    if (pattern.empty()) throw std::runtime_error("policy: empty blocked pattern");
    Rule r;
    r.pattern = pattern;
    r.name = name.empty() ? "custom" : name;
    r.rationale = rationale;
    r.scope = scope;
    try {
        r.re = std::regex(pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw std::runtime_error("policy: invalid blocked pattern '" + pattern + "': " + e.what());
    }
    return r;
}

// ---- PolicyBuilder ----

PolicyBuilder::PolicyBuilder() {
    for (const char* c : kDefaultAllowed) p_.allowed_.insert(c);
    for (const auto& s : kDefaultRules) {
        p_.rules_.push_back(make_rule(s.pattern, s.name, s.rationale, s.scope));
    }
}

PolicyBuilder& PolicyBuilder::clear_allowed_commands() { p_.allowed_.clear(); return *this; }

PolicyBuilder& PolicyBuilder::allow_command(const std::string& name) {
    if (!name.empty()) p_.allowed_.insert(name);
    return *this;
}

PolicyBuilder& PolicyBuilder::clear_rules() { p_.rules_.clear(); return *this; }

PolicyBuilder& PolicyBuilder::add_rule(const std::string& pattern, const std::string& name,
                                       const std::string& rationale, RuleScope scope) {
    p_.rules_.push_back(make_rule(pattern, name, rationale, scope));
    return *this;
}

PolicyBuilder& PolicyBuilder::max_command_length(int n) { p_.max_command_len_ = n; return *this; }
PolicyBuilder& PolicyBuilder::max_script_length(int n) { p_.max_script_len_ = n; return *this; }

PolicyBuilder& PolicyBuilder::timeouts(int default_sec, int max_sec) {
    p_.default_timeout_ = default_sec;
    p_.max_timeout_ = max_sec;
    return *this;
}

PolicyBuilder& PolicyBuilder::script_timeouts(int default_sec, int max_sec) {
    p_.script_default_timeout_ = default_sec;
    p_.script_max_timeout_ = max_sec;
    return *this;
}

PolicyBuilder& PolicyBuilder::allow_shell_access_by_default(bool v) { p_.allow_shell_access_ = v; return *this; }
PolicyBuilder& PolicyBuilder::allow_execution_policy_override(bool v) { p_.allow_exec_policy_override_ = v; return *this; }

SecurityPolicy PolicyBuilder::build() const {
    if (p_.max_command_len_ <= 0 || p_.max_script_len_ <= 0) {
        throw std::runtime_error("policy: length limits must be positive");
    }
    if (p_.default_timeout_ <= 0 || p_.default_timeout_ > p_.max_timeout_) {
        throw std::runtime_error("policy: require 0 < default_timeout <= max_timeout");
    }
    if (p_.script_default_timeout_ <= 0 || p_.script_default_timeout_ > p_.script_max_timeout_) {
        throw std::runtime_error("policy: require 0 < script_default_timeout <= script_max_timeout");
    }
    return p_;
}

SecurityPolicy default_policy() {
    return PolicyBuilder().build();
}

SecurityPolicy load_policy_json(const std::string& json) {
    json_util::Doc d = json_util::parse(json);
    if (!d || !json_object_is_type(d.root, json_type_object)) {
        throw std::runtime_error("policy: document is not a JSON object");
    }
    json_object* root = d.root;

    PolicyBuilder b;

    if (json_util::has_key(root, "allowed_commands")) {
        json_object* arr = json_util::member(root, "allowed_commands");
        if (!json_object_is_type(arr, json_type_array)) {
            throw std::runtime_error("policy: allowed_commands must be an array");
        }
        b.clear_allowed_commands();
        for (const auto& c : json_util::get_array_strings(root, "allowed_commands")) b.allow_command(c);
    }
    for (const auto& c : json_util::get_array_strings(root, "extra_allowed_commands")) b.allow_command(c);

    if (json_util::get_bool(root, "replace_blocked_patterns").value_or(false)) b.clear_rules();

    if (json_object* arr = json_util::member(root, "blocked_patterns")) {
        if (!json_object_is_type(arr, json_type_array)) {
            throw std::runtime_error("policy: blocked_patterns must be an array");
        }
        const size_t n = json_object_array_length(arr);
        for (size_t i = 0; i < n; i++) {
            json_object* el = json_object_array_get_idx(arr, i);
            if (el && json_object_is_type(el, json_type_string)) {
                b.add_rule(json_object_get_string(el), "custom", "", RuleScope::STATEMENT);
            } else if (el && json_object_is_type(el, json_type_object)) {
                auto pattern = json_util::get_string(el, "pattern");
                if (!pattern) throw std::runtime_error("policy: blocked pattern object without 'pattern'");
                b.add_rule(*pattern,
                           json_util::get_string(el, "name").value_or("custom"),
                           json_util::get_string(el, "rationale").value_or(""),
                           parse_scope(json_util::get_string(el, "scope").value_or("")));
            } else {
                throw std::runtime_error("policy: blocked_patterns[" + std::to_string(i) + "] must be a string or object");
            }
        }
    }

    const SecurityPolicy defaults{};
    b.max_command_length(read_positive(root, "max_command_length", defaults.max_command_length()));
    b.max_script_length(read_positive(root, "max_script_length", defaults.max_script_length()));
    b.timeouts(read_positive(root, "default_timeout", defaults.default_timeout_seconds()),
               read_positive(root, "max_timeout", defaults.max_timeout_seconds()));
    b.script_timeouts(read_positive(root, "script_default_timeout", defaults.script_default_timeout_seconds()),
                      read_positive(root, "script_max_timeout", defaults.script_max_timeout_seconds()));
    b.allow_shell_access_by_default(read_flag(root, "allow_shell_access", defaults.allow_shell_access_by_default()));
    b.allow_execution_policy_override(read_flag(root, "allow_execution_policy_override",
                                                defaults.allow_execution_policy_override()));
    return b.build();
}

SecurityPolicy load_policy_file(const std::string& path) {
    return load_policy_json(slurp(path));
}

} // namespace psguard
