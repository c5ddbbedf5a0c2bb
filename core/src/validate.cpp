#include "psguard/validate.h"
#include "psguard/sanitize.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>
#include <unordered_set>
#include <vector>

namespace psguard {

namespace {

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
    }
    return s;
}

// Whitespace tokens outside of single/double quotes.
std::vector<std::string> split_unquoted(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    char quote = 0;
    for (char c : s) {
        if (quote) {
            cur.push_back(c);
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') { quote = c; cur.push_back(c); continue; }
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!cur.empty()) { out.push_back(cur); cur.clear(); }
            continue;
        }
        cur.push_back(c);
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

bool is_assignment_token(const std::string& t) {
    static const std::unordered_set<std::string> ops = {"=", "+=", "-=", "*=", "/=", "%=", "??="};
    return ops.count(t) > 0;
}

// `$x=1`, `$x = 1`, `x += 2`: an assignment operator directly after the
// first token, or a bare assignment operator token anywhere.
bool has_assignment(const std::vector<std::string>& toks) {
    if (toks.empty()) return false;
    const std::string& first = toks[0];
    size_t eq = first.find('=');
    if (eq != std::string::npos && first[0] != '-' && first[0] != '"' && first[0] != '\'') {
        bool comparison = (eq + 1 < first.size() && first[eq + 1] == '=');
        if (!comparison) return true;
    }
    for (const auto& t : toks) {
        if (is_assignment_token(t)) return true;
    }
    return false;
}

struct ShellFeature {
    const char* token;
    const char* what;
};

const ShellFeature kShellFeatures[] = {
    {"|", "pipeline"},
    {">", "redirection"},
    {"<", "redirection"},
    {";", "command separator"},
    {"&", "call operator or chaining"},
    {"$(", "subexpression"},
    {"${", "braced variable"},
    {"@(", "array expression"},
    {"(", "grouping"},
    {"{", "script block"},
};

const char* find_shell_feature(const std::string& line) {
    for (const auto& f : kShellFeatures) {
        if (line.find(f.token) != std::string::npos) return f.what;
    }
    return nullptr;
}

const std::regex& control_keyword_re() {
    static const std::regex re(
        R"(^(if|elseif|else|switch|foreach|for|while|do|until|try|catch|finally|throw|trap|)"
        R"(break|continue|return|exit|function|filter|workflow|configuration|class|enum|)"
        R"(param|begin|process|end|dynamicparam|using)(?=[\s({]|$))",
        std::regex::ECMAScript | std::regex::icase);
    return re;
}

const std::regex& variable_assignment_re() {
    static const std::regex re(
        R"(^(\[[^\]]+\]\s*)*\$[\w:]+(\.\w+|\[[^\]]*\])*\s*(\?\?|[+\-*/%])?=(?!=))",
        std::regex::ECMAScript);
    return re;
}

// Hashtable entries and property initialisers: `Name = 'x'`, `'Key' = 1`.
const std::regex& key_assignment_re() {
    static const std::regex re(R"(^(['"]?)[A-Za-z_][\w.\-]*\1\s*=(?!=))", std::regex::ECMAScript);
    return re;
}

// `[CmdletBinding()]`, `[Parameter(Mandatory)]`, `[string]` on their own line.
const std::regex& attribute_line_re() {
    static const std::regex re(R"(^\[[A-Za-z][\w.]*(\(.*\))?\]\s*$)", std::regex::ECMAScript);
    return re;
}

bool only_punctuation(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](char c) {
        return c == '{' || c == '}' || c == '(' || c == ')' || c == '[' || c == ']' ||
               c == ';' || c == ',' || std::isspace(static_cast<unsigned char>(c));
    });
}

std::string strip_leading_closers(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == '}' || s[i] == ')' || std::isspace(static_cast<unsigned char>(s[i])))) i++;
    return s.substr(i);
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur)) {
        if (!cur.empty() && cur.back() == '\r') cur.pop_back();
        out.push_back(cur);
    }
    return out;
}

// Text of `line` outside <# ... #> comments, each comment replaced by a
// space. `in_block` carries the comment state across lines. A `<#` inside
// quotes or after a line comment does not open a block.
std::string strip_block_comments(const std::string& line, bool& in_block) {
    std::string out;
    char quote = 0;
    size_t i = 0;
    while (i < line.size()) {
        if (in_block) {
            size_t end = line.find("#>", i);
            if (end == std::string::npos) return out;
            in_block = false;
            out.push_back(' ');
            i = end + 2;
            continue;
        }
        const char c = line[i];
        if (quote) {
            if (c == quote) quote = 0;
            out.push_back(c);
            i++;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            out.push_back(c);
            i++;
            continue;
        }
        if (c == '<' && i + 1 < line.size() && line[i + 1] == '#') {
            in_block = true;
            i += 2;
            continue;
        }
        if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])))) {
            out.append(line, i, std::string::npos);
            return out;
        }
        out.push_back(c);
        i++;
    }
    return out;
}

// Statements of one line: split at `;` outside quotes, parentheses and
// script blocks.
std::vector<std::string> split_statements(const std::string& line) {
    std::vector<std::string> out;
    std::string cur;
    char quote = 0;
    int depth = 0;
    for (char c : line) {
        if (quote) {
            if (c == quote) quote = 0;
            cur.push_back(c);
            continue;
        }
        if (c == '\'' || c == '"') quote = c;
        else if (c == '(' || c == '{') depth++;
        else if ((c == ')' || c == '}') && depth > 0) depth--;
        else if (c == ';' && depth == 0) {
            out.push_back(cur);
            cur.clear();
            continue;
        }
        cur.push_back(c);
    }
    out.push_back(cur);
    return out;
}

} // namespace

bool is_builtin_intrinsic(const std::string& name) {
    static const std::unordered_set<std::string> intrinsics = {
        "Get-ChildItem", "Get-Content", "Get-Item", "Test-Path", "Get-Location", "Get-Date",
        "Get-Host", "Write-Host", "Write-Output", "Write-Error", "Write-Warning", "Write-Verbose",
        "Out-String", "Select-String", "Select-Object", "Where-Object", "ForEach-Object",
        "Sort-Object", "Group-Object", "Measure-Object", "Compare-Object", "Join-String",
        "Format-Table", "Format-List", "ConvertTo-Json", "ConvertFrom-Json", "Get-Command",
        "Get-Variable", "Get-Module", "Get-Help", "Resolve-Path", "Split-Path", "Join-Path",
        "Start-Sleep",
    };
    return intrinsics.count(name) > 0;
}

std::string extract_base_command(const std::string& line) {
    std::string cmd = trim_ws(line);
    size_t i = 0;
    while (i < cmd.size() && (cmd[i] == '|' || cmd[i] == ';' || std::isspace(static_cast<unsigned char>(cmd[i])))) i++;
    cmd = cmd.substr(i);

    size_t pipe = cmd.find('|');
    if (pipe != std::string::npos) cmd = trim_ws(cmd.substr(0, pipe));

    auto toks = split_unquoted(cmd);
    if (toks.empty()) return "";
    if (has_assignment(toks)) return "";

    std::string first = toks[0];
    if (first[0] == '-' || first[0] == '$') return "";

    size_t cut = first.find_first_of(";(){}");
    if (cut != std::string::npos) first = first.substr(0, cut);
    return first;
}

bool contains_shell_features(const std::string& line) {
    return find_shell_feature(line) != nullptr;
}

bool is_control_structure(const std::string& line) {
    std::string t = trim_ws(line);
    if (t.empty()) return false;

    std::string lt = lower_ascii(t);
    if (lt.rfind("#requires", 0) == 0 || lt.rfind("#region", 0) == 0 || lt.rfind("#endregion", 0) == 0) {
        return true;
    }
    if (std::regex_search(t, control_keyword_re())) return true;
    if (std::regex_search(t, variable_assignment_re())) return true;
    if (std::regex_search(t, key_assignment_re())) return true;
    if (std::regex_search(t, attribute_line_re())) return true;
    return false;
}

const Rule* match_rule(const SecurityPolicy& policy, const std::string& text, const RuleScope* scope) {
    for (const auto& r : policy.rules()) {
        if (scope && r.scope != *scope) continue;
        if (std::regex_search(text, r.re)) return &r;
    }
    return nullptr;
}

ValidationOutcome validate_command(const SecurityPolicy& policy,
                                   const std::string& command,
                                   bool allow_shell_access) {
    if (command.size() > static_cast<size_t>(policy.max_command_length())) {
        return ValidationOutcome::fail("max_length",
            "Command too long (max " + std::to_string(policy.max_command_length()) + " characters)");
    }
    if (!is_valid_utf8(command)) {
        return ValidationOutcome::fail("utf8_validation", "Command contains invalid UTF-8 characters");
    }
    if (sanitize_input(command) != command) {
        return ValidationOutcome::fail("character_validation", "Command contains invalid characters");
    }

    // Single commands are held to every rule, composite ones included.
    if (const Rule* r = match_rule(policy, command, nullptr)) {
        return ValidationOutcome::fail("blocked_pattern",
            "Blocked pattern detected (" + r->name + "): " + r->pattern, r->pattern);
    }

    // Every `;` statement names its own command.
    int statements = 0;
    for (const auto& stmt : split_statements(command)) {
        if (trim_ws(stmt).empty()) continue;
        statements++;
        std::string base = extract_base_command(stmt);
        if (base.empty()) {
            return ValidationOutcome::fail("command_extraction", "Unable to determine base command");
        }
        if (!is_builtin_intrinsic(base) && !policy.is_allowed(base)) {
            return ValidationOutcome::fail("allowed_commands", "Command not allowed: " + base);
        }
    }
    if (statements == 0) {
        return ValidationOutcome::fail("command_extraction", "Unable to determine base command");
    }

    if (!allow_shell_access && !policy.allow_shell_access_by_default()) {
        if (const char* what = find_shell_feature(command)) {
            return ValidationOutcome::fail("shell_access", std::string("Shell features not allowed: ") + what);
        }
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_script(const SecurityPolicy& policy,
                                  const std::string& script) {
    if (script.size() > static_cast<size_t>(policy.max_script_length())) {
        return ValidationOutcome::fail("max_length",
            "Script too long (max " + std::to_string(policy.max_script_length()) + " characters)");
    }
    if (!is_valid_utf8(script)) {
        return ValidationOutcome::fail("utf8_validation", "Script contains invalid UTF-8 characters");
    }
    if (sanitize_script(script) != script) {
        return ValidationOutcome::fail("character_validation", "Script contains invalid characters");
    }

    // Whole-script pass first: constructs that need more than one line or token.
    const RuleScope composite = RuleScope::COMPOSITE;
    if (const Rule* r = match_rule(policy, script, &composite)) {
        return ValidationOutcome::fail("dangerous_constructs",
            "Script contains dangerous constructs (" + r->name + "): " + r->pattern, r->pattern);
    }

    const RuleScope statement = RuleScope::STATEMENT;
    const auto lines = split_lines(script);
    bool in_block_comment = false;
    for (size_t i = 0; i < lines.size(); i++) {
        const int lineno = static_cast<int>(i) + 1;
        const std::string t = trim_ws(strip_block_comments(lines[i], in_block_comment));
        if (t.empty() || t[0] == '#') continue;

        if (const Rule* r = match_rule(policy, t, &statement)) {
            return ValidationOutcome::fail("blocked_pattern",
                "Blocked pattern detected at line " + std::to_string(lineno) + " (" + r->name + "): " + r->pattern,
                r->pattern, lineno);
        }

        for (const auto& stmt : split_statements(t)) {
            std::string rest = strip_leading_closers(trim_ws(stmt));
            if (only_punctuation(rest)) continue;
            if (is_control_structure(rest)) continue;

            std::string base = extract_base_command(rest);
            if (base.empty()) {
                return ValidationOutcome::fail("command_extraction",
                    "Unable to determine base command at line " + std::to_string(lineno), "", lineno);
            }
            if (!is_builtin_intrinsic(base) && !policy.is_allowed(base)) {
                return ValidationOutcome::fail("allowed_commands",
                    "Command not allowed at line " + std::to_string(lineno) + ": " + base, "", lineno);
            }
        }
    }
    return ValidationOutcome::ok();
}

} // namespace psguard
