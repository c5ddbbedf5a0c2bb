#include "test_common.h"

#include "psguard/policy.h"
#include "psguard/validate.h"

using namespace psguard;

static void expect_rule(const ValidationOutcome& v, const std::string& rule, const std::string& what) {
    expect_true(!v.valid, what + ": expected rejection");
    expect_eq_str(v.rule, rule, what + ": rule");
    expect_true(!v.reason.empty(), what + ": reason present");
}

int main() {
    const SecurityPolicy p = default_policy();

    // base command extraction
    expect_eq_str(extract_base_command("  git status"), "git", "leading whitespace");
    expect_eq_str(extract_base_command("|git status"), "git", "leading pipe stripped");
    expect_eq_str(extract_base_command("; Get-Date"), "Get-Date", "leading separator stripped");
    expect_eq_str(extract_base_command("Get-Date;"), "Get-Date", "trailing separator cut");
    expect_eq_str(extract_base_command("Get-ChildItem | Sort-Object"), "Get-ChildItem", "first pipeline segment");
    expect_eq_str(extract_base_command("git log --format=%H"), "git", "flag with '=' is not an assignment");
    expect_eq_str(extract_base_command("$env:PATH"), "", "variable reference");
    expect_eq_str(extract_base_command("-Recurse"), "", "bare parameter");
    expect_eq_str(extract_base_command("$x = 5"), "", "assignment");
    expect_eq_str(extract_base_command("x=5"), "", "assignment without spaces");
    expect_eq_str(extract_base_command("count += 1"), "", "compound assignment");
    expect_eq_str(extract_base_command("   "), "", "blank");

    // shell features
    expect_true(contains_shell_features("a | b"), "pipeline");
    expect_true(contains_shell_features("a > out.txt"), "redirection");
    expect_true(contains_shell_features("a; b"), "separator");
    expect_true(contains_shell_features("& 'tool.exe'"), "call operator");
    expect_true(contains_shell_features("echo $(whoami)"), "subexpression");
    expect_true(contains_shell_features("@(1,2)"), "array expression");
    expect_true(!contains_shell_features("git status --short"), "plain command");

    // accepted
    ValidationOutcome v = validate_command(p, "Get-ChildItem -Path . -Filter *.go", false);
    expect_true(v.valid, "Get-ChildItem listing should pass: " + v.reason);
    v = validate_command(p, "git log --format=%H -n 3", false);
    expect_true(v.valid, "git with '=' flag should pass: " + v.reason);
    v = validate_command(p, "Get-Help about_Pipelines", false);
    expect_true(v.valid, "intrinsic outside allow-list should pass: " + v.reason);

    // length / encoding / characters
    expect_rule(validate_command(p, "echo " + std::string(1000, 'a'), false), "max_length", "too long");
    expect_rule(validate_command(p, "echo \xff", false), "utf8_validation", "invalid UTF-8");
    expect_rule(validate_command(p, "echo caf\xc3\xa9", false), "character_validation", "non-ASCII");
    expect_rule(validate_command(p, std::string("echo a\0b", 8), false), "character_validation", "NUL");
    expect_rule(validate_command(p, "echo a\rb", false), "character_validation", "CR");

    // blocked patterns report the exact pattern
    v = validate_command(p, "Remove-Item -Recurse -Force C:\\", false);
    expect_rule(v, "blocked_pattern", "recursive drive delete");
    expect_eq_str(v.pattern, p.rules().front().pattern, "first rule's pattern reported");

    v = validate_command(p, "STOP-COMPUTER -Force", false);
    expect_rule(v, "blocked_pattern", "case-insensitive match");
    expect_true(v.reason.find("system_power") != std::string::npos, "rule name in reason");

    // composite rules apply to single commands too
    v = validate_command(p, "iex 'Get-Date'", true);
    expect_rule(v, "blocked_pattern", "dynamic evaluation");
    expect_true(v.reason.find("dynamic_evaluation") != std::string::npos, "composite rule name in reason");

    // blocked patterns win over the allow-list and the shell flag
    expect_rule(validate_command(p, "Start-Process pwsh -Verb RunAs", true), "blocked_pattern", "elevation");

    // extraction / allow-list
    expect_rule(validate_command(p, "$x = 5", false), "command_extraction", "assignment");
    expect_rule(validate_command(p, "-Force", false), "command_extraction", "bare parameter");
    expect_rule(validate_command(p, "$env:USERPROFILE", false), "command_extraction", "variable");
    v = validate_command(p, "nmap -sS 10.0.0.1", false);
    expect_rule(v, "allowed_commands", "unlisted command");
    expect_true(v.reason.find("nmap") != std::string::npos, "base command named in reason");
    expect_rule(validate_command(p, "get-childitem", false), "allowed_commands", "allow-list is case-sensitive");

    // shell composition
    expect_rule(validate_command(p, "Get-ChildItem | Select-Object Name", false), "shell_access", "pipeline");
    expect_rule(validate_command(p, "git status; git log", false), "shell_access", "separator");
    expect_rule(validate_command(p, "Write-Output $(Get-Date)", false), "shell_access", "subexpression");
    expect_rule(validate_command(p, "| git status", false), "shell_access", "leading pipe still composition");
    v = validate_command(p, "Get-ChildItem | Select-Object Name", true);
    expect_true(v.valid, "pipeline allowed with per-call flag: " + v.reason);

    v = validate_command(p, "Get-Date; nmap localhost", true);
    expect_rule(v, "allowed_commands", "every statement checked");
    v = validate_command(p, "git status; git log", true);
    expect_true(v.valid, "allowed statements with shell access: " + v.reason);
    expect_rule(validate_command(p, ";", true), "command_extraction", "separator only");

    const SecurityPolicy open = PolicyBuilder().allow_shell_access_by_default(true).build();
    v = validate_command(open, "Get-ChildItem > files.txt", false);
    expect_true(v.valid, "redirection allowed by policy default: " + v.reason);

    // empty allow-list: only intrinsics remain
    const SecurityPolicy bare = PolicyBuilder().clear_allowed_commands().build();
    expect_true(validate_command(bare, "Get-Date", false).valid, "intrinsic with empty allow-list");
    expect_rule(validate_command(bare, "git status", false), "allowed_commands", "git with empty allow-list");

    std::cerr << "test_validate_command: ALL PASSED" << std::endl;
    return 0;
}
