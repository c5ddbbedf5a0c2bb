#include "test_common.h"

#include "psguard/audit.h"
#include "psguard/hash.h"
#include "psguard/json_util.h"

#include <csignal>
#include <fstream>
#include <thread>
#include <vector>

#include <sys/resource.h>

using namespace psguard;
namespace fs = std::filesystem;

static AuditEntry sample(const std::string& op, bool success) {
    AuditEntry e;
    e.operation = op;
    e.command_or_script = "Get-ChildItem -Path .";
    e.working_directory = "/work";
    e.environment_overrides = {{"MY_VAR", "1"}};
    e.duration_ms = 12;
    e.success = success;
    e.error_code = success ? ErrorCode::NONE : ErrorCode::SECURITY;
    e.actor = "tester";
    if (!success) e.validation = ValidationOutcome::fail("blocked_pattern", "Blocked", "x");
    return e;
}

int main() {
    // Test 1: SHA-256 vectors (empty, one block, two-block padding)
    expect_eq_str(hash::sha256_hex(""),
                  "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 empty");
    expect_eq_str(hash::sha256_hex("abc"),
                  "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 abc");
    expect_eq_str(hash::sha256_hex("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
                  "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1", "sha256 448-bit");
    hash::Sha256 inc;
    inc.update("ab");
    inc.update("c");
    expect_eq_str(inc.hex_digest(), hash::sha256_hex("abc"), "incremental == one-shot");

    fs::path dir = make_test_dir("psguard_test_audit");
    fs::path file = dir / "logs" / "audit.log";

    // Test 2: startup, entries, shutdown; canonical chained lines
    {
        AuditConfig cfg;
        cfg.path = file.string();
        AuditLogger log(cfg);
        std::string err = log.open();
        expect_true(err.empty(), "open: " + err);
        log.log(sample("execute_command", true));
        log.log(sample("execute_command", false));
        AuditStats st = log.stats();
        expect_true(st.enabled, "stats enabled");
        expect_eq_ll(st.entries_written, 3, "startup + 2 entries");
        expect_true(st.file_size > 0, "stats file size");
        expect_eq_str(st.path, file.string(), "stats path");
    }
    auto lines = read_lines(file);
    expect_eq_ll(static_cast<long long>(lines.size()), 4, "startup + 2 + shutdown");
    {
        json_util::Doc first = json_util::parse(lines[0]);
        expect_eq_str(json_util::get_string(first.root, "event_type").value_or(""), "startup", "startup first");
        expect_eq_str(json_util::get_string(first.root, "chain_prev").value_or(""), hash::zero_hash_hex(),
                      "chain starts at zero");

        json_util::Doc rejected = json_util::parse(lines[2]);
        expect_eq_str(json_util::get_string(rejected.root, "operation").value_or(""), "execute_command", "operation");
        expect_true(!json_util::get_bool(rejected.root, "success").value_or(true), "success=false");
        expect_eq_ll(json_util::get_number_as_int(rejected.root, "error_code").value_or(0), -32001, "error code");
        expect_eq_str(json_util::get_string(rejected.root, "error_type").value_or(""), "Security", "error type");
        expect_eq_str(json_util::get_string(rejected.root, "actor").value_or(""), "tester", "actor");
        expect_true(json_util::member(rejected.root, "validation") != nullptr, "validation embedded");
        expect_true(json_util::member(rejected.root, "result") == nullptr, "no result for a rejection");

        json_util::Doc last = json_util::parse(lines[3]);
        expect_eq_str(json_util::get_string(last.root, "event_type").value_or(""), "shutdown", "shutdown last");

        // keys are sorted: "actor" < "chain_hash" < ...
        expect_true(lines[1].rfind("{\"actor\":", 0) == 0, "canonical key order: " + lines[1].substr(0, 20));
    }
    ChainVerifyResult vr = verify_audit_chain(file.string());
    expect_true(vr.ok, "chain verifies: " + vr.error);
    expect_eq_ll(vr.lines, 4, "verified lines");

    // Test 3: reopening continues the chain
    {
        AuditConfig cfg;
        cfg.path = file.string();
        AuditLogger log(cfg);
        expect_true(log.open().empty(), "reopen");
        log.log(sample("check_command_exists", true));
    }
    vr = verify_audit_chain(file.string());
    expect_true(vr.ok, "resumed chain verifies: " + vr.error);
    expect_eq_ll(vr.lines, 7, "lines after reopen");

    // Test 4: tampering is detected at the edited line
    lines = read_lines(file);
    fs::path tampered = dir / "tampered.log";
    {
        std::ofstream out(tampered);
        for (size_t i = 0; i < lines.size(); i++) {
            std::string l = lines[i];
            if (i == 2) {
                auto pos = l.find("\"success\":false");
                expect_true(pos != std::string::npos, "field to tamper present");
                l.replace(pos, 15, "\"success\":true");
            }
            out << l << "\n";
        }
    }
    vr = verify_audit_chain(tampered.string());
    expect_true(!vr.ok, "tampering detected");
    expect_eq_ll(vr.bad_line, 3, "tampered line reported");

    // deletion breaks the link of the following line
    fs::path truncated = dir / "deleted.log";
    {
        std::ofstream out(truncated);
        for (size_t i = 0; i < lines.size(); i++) {
            if (i != 1) out << lines[i] << "\n";
        }
    }
    vr = verify_audit_chain(truncated.string());
    expect_true(!vr.ok, "deletion detected");
    expect_eq_ll(vr.bad_line, 2, "line after the gap reported");

    // Test 5: concurrent writers produce whole, chained lines
    fs::path conc = dir / "concurrent.log";
    {
        AuditConfig cfg;
        cfg.path = conc.string();
        cfg.fsync = false;
        AuditLogger log(cfg);
        expect_true(log.open().empty(), "open concurrent");
        std::vector<std::thread> ts;
        for (int t = 0; t < 8; t++) {
            ts.emplace_back([&log, t]() {
                for (int i = 0; i < 25; i++) {
                    log.log(sample("execute_script", (i + t) % 2 == 0));
                }
            });
        }
        for (auto& th : ts) th.join();
        expect_eq_ll(log.stats().entries_written, 201, "all entries written");
    }
    vr = verify_audit_chain(conc.string());
    expect_true(vr.ok, "concurrent chain verifies: " + vr.error);
    expect_eq_ll(vr.lines, 202, "8*25 + startup + shutdown");

    // Test 6: disabled logger never touches the filesystem
    fs::path off = dir / "disabled" / "audit.log";
    {
        AuditConfig cfg;
        cfg.enabled = false;
        cfg.path = off.string();
        AuditLogger log(cfg);
        expect_true(log.open().empty(), "disabled open is a no-op");
        log.log(sample("execute_command", true));
        expect_true(!log.stats().enabled, "stats report disabled");
        log.close();
    }
    expect_true(!fs::exists(off.parent_path()), "disabled logger created nothing");

    // Test 7: unusable path is reported, logging stays harmless
    {
        AuditConfig cfg;
        cfg.path = "/dev/null/psguard/audit.log";
        AuditLogger log(cfg);
        expect_true(!log.open().empty(), "open under a non-directory fails");
        log.log(sample("execute_command", true));
        expect_eq_ll(log.stats().entries_written, 0, "nothing written");
    }

    // Test 8: verify on a missing file
    vr = verify_audit_chain((dir / "nope.log").string());
    expect_true(!vr.ok && !vr.error.empty(), "missing file reported");

    // Test 9: a failed append leaves no partial line behind
    fs::path limited = dir / "limited.log";
    {
        AuditConfig cfg;
        cfg.path = limited.string();
        cfg.fsync = false;
        AuditLogger log(cfg);
        expect_true(log.open().empty(), "open limited log");
        log.log(sample("execute_command", true));
        const long long size_before = static_cast<long long>(fs::file_size(limited));

        std::signal(SIGXFSZ, SIG_IGN);
        struct rlimit old{};
        expect_true(::getrlimit(RLIMIT_FSIZE, &old) == 0, "getrlimit");
        struct rlimit tight = old;
        tight.rlim_cur = static_cast<rlim_t>(size_before + 16);
        expect_true(::setrlimit(RLIMIT_FSIZE, &tight) == 0, "setrlimit");
        log.log(sample("execute_script", false));
        expect_true(::setrlimit(RLIMIT_FSIZE, &old) == 0, "restore rlimit");

        expect_eq_ll(static_cast<long long>(fs::file_size(limited)), size_before, "partial line cut off");
        expect_eq_ll(log.stats().entries_written, 2, "failed entry not counted");
        log.log(sample("execute_command", true));
    }
    vr = verify_audit_chain(limited.string());
    expect_true(vr.ok, "chain intact after a failed append: " + vr.error);
    expect_eq_ll(vr.lines, 4, "startup, two entries, shutdown");

    // Test 10: a full device fails the startup entry instead of hanging on resume
    if (fs::exists("/dev/full")) {
        AuditConfig cfg;
        cfg.path = "/dev/full";
        cfg.fsync = false;
        AuditLogger log(cfg);
        expect_true(!log.open().empty(), "startup entry on a full device");
        log.log(sample("execute_command", true));
        expect_eq_ll(log.stats().entries_written, 0, "nothing counted");
    }

    std::error_code ec;
    fs::remove_all(dir, ec);

    std::cerr << "test_audit: ALL PASSED" << std::endl;
    return 0;
}
