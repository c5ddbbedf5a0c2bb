#include "psguard/audit.h"
#include "psguard/hash.h"
#include "psguard/json_util.h"
#include "psguard/serialization.h"

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace psguard {

using namespace json_util;

static std::string iso_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// chain_hash of the last non-empty line, or zeros for a new/empty file.
static std::string resume_chain(const std::string& path, std::string* warn) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0 || !S_ISREG(st.st_mode)) return hash::zero_hash_hex();
    std::ifstream in(path);
    if (!in) return hash::zero_hash_hex();
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    if (last.empty()) return hash::zero_hash_hex();

    Doc d = parse(last);
    auto h = get_string(d.root, "chain_hash");
    if (!h || h->size() != 64) {
        *warn = "last line of existing audit file carries no chain_hash; chain restarts";
        return hash::zero_hash_hex();
    }
    return *h;
}

AuditLogger::AuditLogger(AuditConfig cfg)
    : cfg_(std::move(cfg)), chain_prev_(hash::zero_hash_hex()) {}

AuditLogger::~AuditLogger() {
    close();
}

std::string AuditLogger::open() {
    if (!cfg_.enabled) return "";
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (fd_ >= 0) return "";

        std::error_code ec;
        auto parent = std::filesystem::path(cfg_.path).parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) return std::string("create_directories: ") + ec.message();
        }

        std::string warn;
        chain_prev_ = resume_chain(cfg_.path, &warn);
        if (!warn.empty()) std::cerr << "[psguard] audit: " << warn << std::endl;

        fd_ = ::open(cfg_.path.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC, 0644);
        if (fd_ < 0) return std::string("open: ") + std::strerror(errno);
    }

    json_object* rec = base_record("startup");
    add_string(rec, "server_version", cfg_.server_version);
    std::string err = append_record(rec);
    if (!err.empty()) {
        std::lock_guard<std::mutex> lk(mu_);
        ::close(fd_);
        fd_ = -1;
        return "startup entry: " + err;
    }
    return "";
}

void AuditLogger::close() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (fd_ < 0) return;
    }
    std::string err = append_record(base_record("shutdown"));
    if (!err.empty()) std::cerr << "[psguard] audit: shutdown entry: " << err << std::endl;

    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

json_object* AuditLogger::base_record(const char* event_type) const {
    json_object* rec = json_object_new_object();
    add_string(rec, "timestamp", iso_now());
    add_string(rec, "event_type", event_type);
    add_string(rec, "server_name", cfg_.server_name);
    add_int(rec, "pid", static_cast<int64_t>(::getpid()));
    return rec;
}

void AuditLogger::log(const AuditEntry& e) {
    if (!cfg_.enabled) return;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (fd_ < 0) return;
    }

    json_object* rec = base_record("operation");
    add_string(rec, "operation", e.operation);
    add_string(rec, "command_or_script", e.command_or_script);
    add_string(rec, "working_directory", e.working_directory);
    json_object_object_add(rec, "environment_overrides", new_string_map(e.environment_overrides));
    if (e.result) json_object_object_add(rec, "result", execution_result_to_json(*e.result));
    if (e.validation) json_object_object_add(rec, "validation", validation_to_json(*e.validation));
    add_int(rec, "duration_ms", e.duration_ms);
    add_bool(rec, "success", e.success);
    add_int(rec, "error_code", static_cast<int>(e.error_code));
    add_string(rec, "error_type", error_type_name(e.error_code));

    std::string actor = e.actor;
    if (actor.empty()) {
        const char* u = std::getenv("USER");
        actor = u ? u : "";
    }
    add_string(rec, "actor", actor);

    std::string err = append_record(rec);
    if (!err.empty()) {
        std::cerr << "[psguard] audit: failed to write entry for " << e.operation << ": " << err << std::endl;
    }
}

std::string AuditLogger::append_record(json_object* rec) {
    const std::string record = canonical_json(rec);

    std::lock_guard<std::mutex> lk(mu_);
    if (fd_ < 0) {
        json_object_put(rec);
        return "audit file not open";
    }

    hash::Sha256 h;
    h.update(chain_prev_);
    h.update(record);
    const std::string chain_hash = h.hex_digest();

    add_string(rec, "chain_prev", chain_prev_);
    add_string(rec, "chain_hash", chain_hash);
    const std::string line = canonical_json(rec);
    json_object_put(rec);

    std::string err = append_locked(line);
    if (err.empty()) {
        chain_prev_ = chain_hash;
        entries_++;
    }
    return err;
}

std::string AuditLogger::append_locked(const std::string& canonical_record) {
    std::string line = canonical_record;
    line.push_back('\n');

    // A failed append is cut back off so the file stays line-aligned.
    const off_t start = ::lseek(fd_, 0, SEEK_END);
    auto rollback = [&](const std::string& err) {
        if (start >= 0 && ::ftruncate(fd_, start) != 0) {
            return err + "; ftruncate: " + std::strerror(errno);
        }
        return err;
    };

    const char* p = line.data();
    size_t off = 0;
    while (off < line.size()) {
        ssize_t w = ::write(fd_, p + off, line.size() - off);
        if (w < 0) {
            if (errno == EINTR) continue;
            return rollback(std::string("write: ") + std::strerror(errno));
        }
        off += static_cast<size_t>(w);
    }

    if (cfg_.fsync && ::fsync(fd_) != 0) {
        return rollback(std::string("fsync: ") + std::strerror(errno));
    }
    return "";
}

AuditStats AuditLogger::stats() const {
    std::lock_guard<std::mutex> lk(mu_);
    AuditStats s;
    s.enabled = cfg_.enabled;
    s.path = cfg_.path;
    s.entries_written = entries_;
    s.last_hash = chain_prev_;
    if (fd_ >= 0) {
        struct stat st{};
        if (::fstat(fd_, &st) == 0) s.file_size = static_cast<long long>(st.st_size);
    }
    return s;
}

ChainVerifyResult verify_audit_chain(const std::string& path) {
    ChainVerifyResult r;
    std::ifstream in(path);
    if (!in) {
        r.error = "cannot open " + path;
        return r;
    }

    std::string expected_prev = hash::zero_hash_hex();
    std::string line;
    long long lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        if (line.empty()) continue;
        r.lines++;

        Doc d = parse(line);
        if (!d || !json_object_is_type(d.root, json_type_object)) {
            r.bad_line = lineno;
            r.error = "line is not a JSON object";
            return r;
        }
        auto prev = get_string(d.root, "chain_prev");
        auto stored = get_string(d.root, "chain_hash");
        if (!prev || !stored) {
            r.bad_line = lineno;
            r.error = "missing chain fields";
            return r;
        }
        if (*prev != expected_prev) {
            r.bad_line = lineno;
            r.error = "chain_prev does not match previous chain_hash";
            return r;
        }

        json_object_object_del(d.root, "chain_prev");
        json_object_object_del(d.root, "chain_hash");
        hash::Sha256 h;
        h.update(*prev);
        h.update(canonical_json(d.root));
        if (h.hex_digest() != *stored) {
            r.bad_line = lineno;
            r.error = "chain_hash mismatch (record modified)";
            return r;
        }
        expected_prev = *stored;
    }

    r.ok = true;
    return r;
}

} // namespace psguard
