#include "psguard/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

extern char** environ;

namespace psguard {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    bool have_token = false;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (have_token) { out.push_back(cur); cur.clear(); have_token = false; }
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else {
            if (esc) { cur.push_back(c); esc = false; continue; }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    if (have_token) out.push_back(cur);
    return out;
}

std::string find_executable(const std::string& name, const std::string& search_path) {
    if (name.empty()) return "";
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : "";
    }
    std::string path = search_path;
    if (path.empty()) {
        const char* p = std::getenv("PATH");
        path = p ? p : "/usr/local/bin:/usr/bin:/bin";
    }
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find(':', start);
        if (end == std::string::npos) end = path.size();
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        struct stat st{};
        if (::stat(cand.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(cand.c_str(), X_OK) == 0) {
            return cand;
        }
        start = end + 1;
    }
    return "";
}

namespace {

// Inherited environment with overrides applied. Built before fork so the
// child only calls async-signal-safe functions.
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string kv(*e);
        size_t eq = kv.find('=');
        std::string key = eq == std::string::npos ? kv : kv.substr(0, eq);
        if (overrides.count(key)) continue;
        env.push_back(std::move(kv));
    }
    for (const auto& o : overrides) env.push_back(o.first + "=" + o.second);
    return env;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_pair(int p[2]) {
    if (p[0] >= 0) close(p[0]);
    if (p[1] >= 0) close(p[1]);
    p[0] = p[1] = -1;
}

// Read whatever is available without blocking. Returns false on EOF.
bool pump(int fd, std::string& out, size_t cap, bool& truncated) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t can = cap > out.size() ? cap - out.size() : 0;
            size_t take = std::min(static_cast<size_t>(n), can);
            if (take < static_cast<size_t>(n)) truncated = true;
            out.append(buf, take);
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

} // namespace

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const std::map<std::string, std::string>& env_overrides,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }
    const std::string exe = find_executable(argv[0]);
    if (exe.empty()) {
        res->error = "executable not found: " + argv[0];
        return false;
    }

    std::vector<std::string> env = build_environment(env_overrides);
    std::vector<char*> cenv;
    cenv.reserve(env.size() + 1);
    for (auto& s : env) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe(out_pipe) != 0 || pipe(err_pipe) != 0 || pipe2(status_pipe, O_CLOEXEC) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe); close_pair(err_pipe); close_pair(status_pipe);
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        res->error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe); close_pair(err_pipe); close_pair(status_pipe);
        return false;
    }

    if (pid == 0) {
        // child
        auto fail = [&](int code) {
            int e = errno;
            (void)!write(status_pipe[1], &e, sizeof(e));
            _exit(code);
        };

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) { (void)dup2(devnull, STDIN_FILENO); close(devnull); }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        // own process group so a timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != status_pipe[1]) (void)close(fd);
        }

#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) fail(126);

        execve(exe.c_str(), cargv.data(), cenv.data());
        fail(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);
    close(status_pipe[1]);

    // Blocks only until exec or failure: the write end is close-on-exec.
    int child_errno = 0;
    ssize_t sn;
    do {
        sn = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (sn < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (sn == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        close(out_pipe[0]);
        close(err_pipe[0]);
        res->error = (WIFEXITED(status) && WEXITSTATUS(status) == 126 ? "chdir failed: " : "exec failed: ")
                     + std::string(std::strerror(child_errno));
        res->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        return false;
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);
    bool out_open = true;
    bool err_open = true;
    bool child_exited = false;
    int status = 0;

    while (true) {
        if (out_open) out_open = pump(out_pipe[0], res->stdout_data, lim.stdout_max_bytes, res->stdout_truncated);
        if (err_open) err_open = pump(err_pipe[0], res->stderr_data, lim.stderr_max_bytes, res->stderr_truncated);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        int elapsed_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count());
        if (lim.timeout_ms > 0 && elapsed_ms >= lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        struct pollfd pfds[2];
        nfds_t n = 0;
        if (out_open) { pfds[n].fd = out_pipe[0]; pfds[n].events = POLLIN; pfds[n].revents = 0; n++; }
        if (err_open) { pfds[n].fd = err_pipe[0]; pfds[n].events = POLLIN; pfds[n].revents = 0; n++; }
        int slice = 50;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed_ms));
        if (n > 0) (void)poll(pfds, n, slice);
        else (void)poll(nullptr, 0, slice);
    }

    // drain what the group left behind; descendants may still hold the pipes
    if (out_open) (void)pump(out_pipe[0], res->stdout_data, lim.stdout_max_bytes, res->stdout_truncated);
    if (err_open) (void)pump(err_pipe[0], res->stderr_data, lim.stderr_max_bytes, res->stderr_truncated);
    close(out_pipe[0]);
    close(err_pipe[0]);

    res->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace psguard
