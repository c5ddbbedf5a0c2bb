#pragma once

#include "types.h"

#include <json-c/json.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace psguard {

struct AuditConfig {
    bool enabled{true};
    std::string path{"psguard-audit.log"};
    bool fsync{true};
    std::string server_name{"psguard"};
    std::string server_version{"1.0.0"};
};

// One attempted operation. Rejected operations carry `validation` and no
// `result`.
struct AuditEntry {
    std::string operation;                    // execute_command, execute_script, ...
    std::string command_or_script;
    std::string working_directory;
    std::map<std::string, std::string> environment_overrides;
    std::optional<ExecutionResult> result;
    std::optional<ValidationOutcome> validation;
    int64_t duration_ms{0};
    bool success{false};
    ErrorCode error_code{ErrorCode::NONE};
    std::string actor;                        // empty: taken from $USER
};

struct AuditStats {
    bool enabled{false};
    std::string path;
    long long file_size{-1};                  // -1: unknown
    long long entries_written{0};             // this process, startup/shutdown included
    std::string last_hash;
};

// Append-only JSONL audit trail.
//
// Every line is canonical JSON (sorted keys) carrying
//   chain_prev: chain_hash of the previous line (64 zeros for the first)
//   chain_hash: SHA-256(chain_prev || canonical record without chain fields)
// so edits, deletions and reordering of earlier lines are detectable.
// An existing file is appended to and its chain continued.
//
// Thread-safe. The mutex covers hashing and the write(+fsync) of one line
// only. Write failures are reported on stderr and never propagated.
class AuditLogger {
public:
    explicit AuditLogger(AuditConfig cfg);
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    // Opens the file and writes the startup entry. No-op when disabled.
    // Returns empty string on success.
    std::string open();

    // Writes the shutdown entry and closes. Idempotent.
    void close();

    bool enabled() const { return cfg_.enabled; }
    const std::string& path() const { return cfg_.path; }

    void log(const AuditEntry& e);

    AuditStats stats() const;

private:
    json_object* base_record(const char* event_type) const;
    // Consumes `rec`.
    std::string append_record(json_object* rec);
    std::string append_locked(const std::string& canonical_record);

    AuditConfig cfg_;
    int fd_ = -1;
    std::string chain_prev_;
    long long entries_{0};
    mutable std::mutex mu_;
};

struct ChainVerifyResult {
    bool ok{false};
    long long lines{0};
    long long bad_line{0};                    // 1-based; 0 when ok
    std::string error;
};

// Re-hash every line of an audit file and check the chain links.
ChainVerifyResult verify_audit_chain(const std::string& path);

} // namespace psguard
