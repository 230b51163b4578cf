#pragma once
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace wxlogin {

/*
AuditEvent
==========

One security-relevant decision: a login issued or refused, a request
authenticated or rejected.

Field values are strings only and must never contain credentials
(see audit_fields.h for what may be logged).
*/
struct AuditEvent {
    // ISO-8601 UTC with milliseconds; stamped by append() when empty.
    std::string ts_utc;

    // "<subsystem>.<action>": "login.ok", "login.fail", "auth.ok", "auth.fail"
    std::string event;

    // "ok" | "fail" | "deny"
    std::string outcome;

    // appid, openid, code, reason, ip, ua ...
    std::map<std::string, std::string> f;
};

/*
AuditLog
========

Append-only, hash-chained JSONL:

  line_i    = {"ts","event","outcome","prev_hash","line_hash","f"}
  line_hash = SHA256( prev_hash || json_i_without_line_hash )

Tamper-evident, not tamper-proof: whoever can rewrite both the JSONL file and
the state file can rewrite history.

append() is thread-safe; lines are written in call order.
*/
class AuditLog {
public:
    // Ordering: DEBUG < INFO < ADMIN < SECURITY. Events below min level are dropped.
    enum class Level : int {
        DEBUG    = 0,
        INFO     = 1,
        ADMIN    = 2,
        SECURITY = 3,
    };

    AuditLog(std::string jsonl_path, std::string state_path);

    // Returns false if the event was filtered out or could not be written.
    bool append(Level level, const AuditEvent& e);

    // Accepts DEBUG/INFO/ADMIN/SECURITY (any case).
    bool set_min_level_str(const std::string& s);
    std::string min_level_str() const;

    static std::string sha256_hex(const std::string& s);

    // Re-walks a JSONL file and checks every prev_hash/line_hash link.
    // The first line must link to expected_head: the all-zero genesis hash when
    // empty, or the last line_hash of the previous file for a rotated log.
    // Returns the number of verified lines, or -1 (with err set) at the first break.
    static long verify_file(const std::string& jsonl_path, std::string* err = nullptr,
                            const std::string& expected_head = "");

private:
    std::atomic<int> min_level_{static_cast<int>(Level::INFO)};

    std::string jsonl_path_;
    std::string state_path_;

    std::mutex mu_;
    std::string prev_hash_; // cached after first append; guarded by mu_

    std::string load_prev_hash_();
    bool store_prev_hash_(const std::string& h);
};

} // namespace wxlogin
