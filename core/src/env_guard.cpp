#include "psguard/env_guard.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <system_error>

namespace psguard {

namespace {

namespace fs = std::filesystem;

std::string upper_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
    }
    return s;
}

// Canonicalize as far as the path exists; the remainder is normalized lexically.
bool canonical_form(const fs::path& p, fs::path* out) {
    std::error_code ec;
    fs::path c = fs::weakly_canonical(p, ec);
    if (ec) return false;
    *out = c.lexically_normal();
    return true;
}

bool has_parent_segment(const std::string& raw) {
    std::string norm = raw;
    std::replace(norm.begin(), norm.end(), '\\', '/');
    size_t start = 0;
    while (start <= norm.size()) {
        size_t end = norm.find('/', start);
        if (end == std::string::npos) end = norm.size();
        std::string seg = norm.substr(start, end - start);
        // Windows drops trailing spaces: ".. " names the parent too
        while (!seg.empty() && (seg.back() == ' ' || seg.back() == '\t')) seg.pop_back();
        if (seg.size() >= 2 && seg.find_first_not_of('.') == std::string::npos) return true;
        start = end + 1;
    }
    return false;
}

const char* const kDangerousVars[] = {
    // Windows search path, interpreter and profile locations
    "PATH", "PATHEXT", "COMSPEC", "SYSTEMROOT", "SYSTEMDRIVE", "WINDIR", "TEMP", "TMP",
    "USERPROFILE", "HOMEPATH", "HOMEDRIVE", "APPDATA", "LOCALAPPDATA", "PROGRAMFILES",
    "PROGRAMFILES(X86)", "PROGRAMDATA", "PUBLIC", "ALLUSERSPROFILE",
    // identity / domain
    "COMPUTERNAME", "USERNAME", "USERDOMAIN", "LOGONSERVER",
    "PROCESSOR_ARCHITECTURE", "NUMBER_OF_PROCESSORS", "OS",
    // PowerShell
    "PSMODULEPATH", "PSEXECUTIONPOLICYPREFERENCE",
    // POSIX counterparts
    "HOME", "SHELL", "USER", "LOGNAME", "TMPDIR", "IFS", "ENV", "BASH_ENV", "CDPATH",
    "LD_PRELOAD", "LD_LIBRARY_PATH", "LD_AUDIT", "DYLD_INSERT_LIBRARIES", "DYLD_LIBRARY_PATH",
};

} // namespace

bool is_path_under(const fs::path& p, const fs::path& root) {
    fs::path rp, rr;
    if (!canonical_form(p, &rp) || !canonical_form(root, &rr)) return false;
    std::string ps = rp.generic_string();
    std::string rs = rr.generic_string();
    if (ps == rs) return true;
    if (!rs.empty() && rs.back() != '/') rs.push_back('/');
    return ps.rfind(rs, 0) == 0;
}

ValidationOutcome validate_working_directory(const std::string& requested,
                                             const fs::path& root,
                                             fs::path* resolved) {
    if (has_parent_segment(requested)) {
        return ValidationOutcome::fail("path_traversal", "Path traversal not allowed");
    }

    std::string norm = requested;
    std::replace(norm.begin(), norm.end(), '\\', '/');

    fs::path target = norm.empty() ? root : fs::path(norm);
    if (!target.is_absolute()) target = root / target;

    fs::path canon;
    if (!canonical_form(target, &canon)) {
        return ValidationOutcome::fail("directory_exists", "Working directory cannot be resolved: " + requested);
    }
    if (!is_path_under(canon, root)) {
        return ValidationOutcome::fail("path_restriction", "Working directory outside root: " + requested);
    }

    std::error_code ec;
    if (!fs::exists(canon, ec)) {
        return ValidationOutcome::fail("directory_exists", "Working directory does not exist: " + requested);
    }
    if (!fs::is_directory(canon, ec)) {
        return ValidationOutcome::fail("not_directory", "Path is not a directory: " + requested);
    }

    if (resolved) *resolved = canon;
    return ValidationOutcome::ok();
}

ValidationOutcome validate_environment(const std::map<std::string, std::string>& overrides) {
    static const std::regex name_re("^[A-Za-z_][A-Za-z0-9_]*$");
    for (const auto& kv : overrides) {
        const std::string& name = kv.first;
        if (!std::regex_match(name, name_re)) {
            return ValidationOutcome::fail("env_var_format", "Invalid environment variable name: " + name);
        }
        const std::string up = upper_ascii(name);
        for (const char* d : kDangerousVars) {
            if (up == d) {
                return ValidationOutcome::fail("dangerous_env_var",
                    "Dangerous environment variable not allowed: " + name);
            }
        }
    }
    return ValidationOutcome::ok();
}

ValidationOutcome validate_timeout(int timeout_seconds, int max_seconds) {
    if (timeout_seconds <= 0) {
        return ValidationOutcome::fail("timeout_positive", "Timeout must be greater than 0");
    }
    if (timeout_seconds > max_seconds) {
        return ValidationOutcome::fail("timeout_maximum",
            "Timeout exceeds maximum allowed (" + std::to_string(max_seconds) + " seconds)");
    }
    return ValidationOutcome::ok();
}

} // namespace psguard
