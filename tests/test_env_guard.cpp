#include "test_common.h"

#include "psguard/env_guard.h"

#include <fstream>

using namespace psguard;
namespace fs = std::filesystem;

static void expect_rule(const ValidationOutcome& v, const std::string& rule, const std::string& what) {
    expect_true(!v.valid, what + ": expected rejection");
    expect_eq_str(v.rule, rule, what + ": rule");
}

int main() {
    fs::path root = make_test_dir("psguard_test_env_guard");
    std::error_code ec;
    fs::create_directories(root / "a" / "b", ec);
    { std::ofstream f(root / "f.txt"); f << "x"; }
    fs::create_directory_symlink("/", root / "escape", ec);
    const bool have_symlink = !ec;

    // Test 1: accepted directories resolve canonically
    fs::path resolved;
    ValidationOutcome v = validate_working_directory("", root, &resolved);
    expect_true(v.valid, "empty means root: " + v.reason);
    expect_eq_str(resolved.string(), root.string(), "empty resolves to root");

    v = validate_working_directory("a/b", root, &resolved);
    expect_true(v.valid, "relative subdirectory: " + v.reason);
    expect_eq_str(resolved.string(), (root / "a" / "b").string(), "relative resolves under root");

    v = validate_working_directory("a\\b", root, &resolved);
    expect_true(v.valid, "backslash separators: " + v.reason);

    v = validate_working_directory((root / "a").string(), root, &resolved);
    expect_true(v.valid, "absolute path inside root: " + v.reason);

    v = validate_working_directory("./a/./b/", root, &resolved);
    expect_true(v.valid, "dot segments: " + v.reason);

    // Test 2: traversal in any encoding
    expect_rule(validate_working_directory("..", root, nullptr), "path_traversal", "..");
    expect_rule(validate_working_directory("a/../..", root, nullptr), "path_traversal", "nested ..");
    expect_rule(validate_working_directory("a\\..\\..\\etc", root, nullptr), "path_traversal", "backslash ..");
    expect_rule(validate_working_directory("a/..\\b", root, nullptr), "path_traversal", "mixed separators");
    expect_rule(validate_working_directory("a/.. /b", root, nullptr), "path_traversal", "trailing space");
    expect_rule(validate_working_directory("...", root, nullptr), "path_traversal", "dot run");
    // harmless-looking '..' that stays inside root is still refused
    expect_rule(validate_working_directory("a/b/..", root, nullptr), "path_traversal", "inner ..");

    // Test 3: escaping the root
    expect_rule(validate_working_directory("/etc", root, nullptr), "path_restriction", "absolute outside");
    expect_rule(validate_working_directory("/", root, nullptr), "path_restriction", "filesystem root");
    expect_rule(validate_working_directory(root.string() + "_sibling", root, nullptr),
                "path_restriction", "prefix-sharing sibling");
    if (have_symlink) {
        expect_rule(validate_working_directory("escape", root, nullptr), "path_restriction", "symlink escape");
    }

    // Test 4: existence and type
    expect_rule(validate_working_directory("missing", root, nullptr), "directory_exists", "missing dir");
    expect_rule(validate_working_directory("f.txt", root, nullptr), "not_directory", "regular file");

    // Test 5: containment helper
    expect_true(is_path_under(root, root), "root under itself");
    expect_true(is_path_under(root / "a" / "b", root), "child under root");
    expect_true(!is_path_under("/", root), "/ not under root");
    expect_true(!is_path_under(fs::path(root.string() + "x"), root), "sibling not under root");

    // Test 6: environment names
    expect_true(validate_environment({}).valid, "no overrides");
    expect_true(validate_environment({{"MY_VAR", "x"}, {"_PRIVATE2", "../../anything"}}).valid,
                "plain names pass, values not inspected");
    expect_rule(validate_environment({{"PATH", "/evil"}}), "dangerous_env_var", "PATH");
    expect_rule(validate_environment({{"path", "/evil"}}), "dangerous_env_var", "path lowercase");
    expect_rule(validate_environment({{"Ld_Preload", "x.so"}}), "dangerous_env_var", "LD_PRELOAD mixed case");
    expect_rule(validate_environment({{"PSModulePath", "x"}}), "dangerous_env_var", "PSModulePath");
    expect_rule(validate_environment({{"ComSpec", "x"}}), "dangerous_env_var", "ComSpec");
    expect_rule(validate_environment({{"HOME", "/"}}), "dangerous_env_var", "HOME");
    expect_rule(validate_environment({{"1BAD", "x"}}), "env_var_format", "leading digit");
    expect_rule(validate_environment({{"BAD-NAME", "x"}}), "env_var_format", "dash");
    expect_rule(validate_environment({{"", "x"}}), "env_var_format", "empty name");
    expect_rule(validate_environment({{"A=B", "x"}}), "env_var_format", "embedded '='");

    // Test 7: timeouts
    expect_rule(validate_timeout(0, 300), "timeout_positive", "zero");
    expect_rule(validate_timeout(-5, 300), "timeout_positive", "negative");
    expect_rule(validate_timeout(301, 300), "timeout_maximum", "above max");
    expect_true(validate_timeout(300, 300).valid, "at max");
    expect_true(validate_timeout(1, 300).valid, "one second");

    fs::remove_all(root, ec);
    fs::remove_all(root.string() + "_sibling", ec);

    std::cerr << "test_env_guard: ALL PASSED" << std::endl;
    return 0;
}
