#include "psguard/executor.h"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <unistd.h>

namespace psguard {

namespace {

// Temp file holding the script body; unlinked on destruction.
class TempScript {
public:
    TempScript() = default;
    ~TempScript() {
        if (!path_.empty()) ::unlink(path_.c_str());
    }
    TempScript(const TempScript&) = delete;
    TempScript& operator=(const TempScript&) = delete;

    // Returns empty string on success.
    std::string create(const std::string& body, const std::string& suffix) {
        std::error_code ec;
        std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
        if (ec) dir = "/tmp";
        std::string tmpl = (dir / ("psguard_script_XXXXXX" + suffix)).string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');

        int fd = ::mkstemps(buf.data(), static_cast<int>(suffix.size()));
        if (fd < 0) return std::string("mkstemps: ") + std::strerror(errno);
        path_ = buf.data();

        size_t off = 0;
        while (off < body.size()) {
            ssize_t w = ::write(fd, body.data() + off, body.size() - off);
            if (w < 0) {
                if (errno == EINTR) continue;
                std::string err = std::string("write: ") + std::strerror(errno);
                ::close(fd);
                return err;
            }
            off += static_cast<size_t>(w);
        }
        if (::close(fd) != 0) return std::string("close: ") + std::strerror(errno);
        return "";
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace

Interpreter Interpreter::powershell(const SecurityPolicy& policy, const std::string& cmdline) {
    Interpreter in;
    std::vector<std::string> extra;
    if (!cmdline.empty()) {
        std::vector<std::string> toks = split_argv_quoted(cmdline);
        if (!toks.empty()) {
            in.program = toks[0];
            extra.assign(toks.begin() + 1, toks.end());
        }
    }
    if (in.program.empty()) {
        in.program = find_executable("pwsh");
        if (in.program.empty()) in.program = find_executable("powershell");
        // unresolved: the run reports started=false
        if (in.program.empty()) in.program = "pwsh";
    }

    in.command_args = extra;
    in.command_args.insert(in.command_args.end(), {"-NoProfile", "-NonInteractive", "-Command"});

    in.script_args = extra;
    in.script_args.insert(in.script_args.end(), {"-NoProfile", "-NonInteractive"});
    if (policy.allow_execution_policy_override()) {
        in.script_args.insert(in.script_args.end(), {"-ExecutionPolicy", "Bypass"});
    }
    in.script_args.push_back("-File");
    in.script_suffix = ".ps1";
    return in;
}

Executor::Executor(Interpreter interp, size_t output_max_bytes)
    : interp_(std::move(interp)), output_max_bytes_(output_max_bytes) {}

ExecutionResult Executor::run(const ExecutionRequest& req) const {
    ExecutionResult out;

    std::vector<std::string> argv;
    argv.push_back(interp_.program);

    TempScript script;
    if (req.is_script) {
        std::string err = script.create(req.command_or_script, interp_.script_suffix);
        if (!err.empty()) {
            out.error = "temp script: " + err;
            return out;
        }
        argv.insert(argv.end(), interp_.script_args.begin(), interp_.script_args.end());
        argv.push_back(script.path());
    } else {
        argv.insert(argv.end(), interp_.command_args.begin(), interp_.command_args.end());
        argv.push_back(req.command_or_script);
    }

    ProcLimits lim;
    lim.timeout_ms = req.timeout_seconds > 0 ? req.timeout_seconds * 1000 : 0;
    lim.stdout_max_bytes = output_max_bytes_;
    lim.stderr_max_bytes = output_max_bytes_;

    ProcResult pr;
    out.started = proc_run_capture(argv, req.working_directory, req.environment_overrides, lim, &pr);
    out.exit_code = out.started ? pr.exit_code : -1;
    out.stdout_data = std::move(pr.stdout_data);
    out.stderr_data = std::move(pr.stderr_data);
    out.stdout_truncated = pr.stdout_truncated;
    out.stderr_truncated = pr.stderr_truncated;
    out.duration_ms = pr.duration_ms;
    out.timed_out = pr.timed_out;
    out.error = pr.error;

    if (req.is_script && out.started) {
        out.lines_executed = static_cast<int>(
            std::count(req.command_or_script.begin(), req.command_or_script.end(), '\n')) + 1;
    }
    return out;
}

} // namespace psguard
