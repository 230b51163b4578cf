#include "audit_log.h"
#include "wxlogin_util.h"

#include <fstream>
#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>
#include <openssl/sha.h>

namespace wxlogin {

/*
Audit log (hash-chained JSONL)
==============================

Each record is serialized with nlohmann::ordered_json so the byte layout of a
line is fixed by insertion order:

  {"ts":..,"event":..,"outcome":..,"prev_hash":..,"line_hash":..,"f":{..}}

The hash preimage is the same object without "line_hash", dumped compactly,
prefixed by prev_hash. verify_file() rebuilds exactly that preimage from each
parsed line and anchors the first line at the genesis (or a given) head, so
any edit, insertion, deletion or reordering shows up as a broken link.
*/

using ojson = nlohmann::ordered_json;

static const std::string kGenesis(64, '0');

static std::string to_hex(const unsigned char* p, size_t n) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.resize(n * 2);
    for (size_t i = 0; i < n; i++) {
        out[i*2+0] = kHex[(p[i] >> 4) & 0xF];
        out[i*2+1] = kHex[(p[i] >> 0) & 0xF];
    }
    return out;
}

static const char* level_name(AuditLog::Level lv) {
    switch (lv) {
        case AuditLog::Level::DEBUG:    return "DEBUG";
        case AuditLog::Level::INFO:     return "INFO";
        case AuditLog::Level::ADMIN:    return "ADMIN";
        case AuditLog::Level::SECURITY: return "SECURITY";
    }
    return "INFO";
}

// Record without line_hash, in canonical key order.
static ojson record_without_hash(const std::string& ts,
                                 const std::string& event,
                                 const std::string& outcome,
                                 const std::string& prev_hash,
                                 const ojson& fields) {
    ojson j;
    j["ts"] = ts;
    j["event"] = event;
    j["outcome"] = outcome;
    j["prev_hash"] = prev_hash;
    if (!fields.empty()) j["f"] = fields;
    return j;
}

// Same order as above with line_hash inserted before "f".
static ojson record_with_hash(const ojson& without, const std::string& line_hash) {
    ojson j;
    j["ts"] = without.at("ts");
    j["event"] = without.at("event");
    j["outcome"] = without.at("outcome");
    j["prev_hash"] = without.at("prev_hash");
    j["line_hash"] = line_hash;
    if (without.contains("f")) j["f"] = without.at("f");
    return j;
}

AuditLog::AuditLog(std::string jsonl_path, std::string state_path)
    : jsonl_path_(std::move(jsonl_path)), state_path_(std::move(state_path)) {}

std::string AuditLog::sha256_hex(const std::string& s) {
    unsigned char h[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(s.data()), s.size(), h);
    return to_hex(h, sizeof(h));
}

bool AuditLog::set_min_level_str(const std::string& s) {
    const std::string v = lower_ascii(s);
    Level lv;
    if (v == "debug") lv = Level::DEBUG;
    else if (v == "info") lv = Level::INFO;
    else if (v == "admin") lv = Level::ADMIN;
    else if (v == "security") lv = Level::SECURITY;
    else return false;

    min_level_.store(static_cast<int>(lv));
    return true;
}

std::string AuditLog::min_level_str() const {
    return level_name(static_cast<Level>(min_level_.load()));
}

// Missing or malformed state starts a new chain from the all-zero hash.
std::string AuditLog::load_prev_hash_() {
    std::ifstream f(state_path_);
    if (!f.good()) return kGenesis;
    std::string line;
    std::getline(f, line);
    if (line.size() != 64) return kGenesis;
    return line;
}

bool AuditLog::store_prev_hash_(const std::string& h) {
    std::ofstream f(state_path_, std::ios::trunc);
    if (!f.good()) return false;
    f << h << "\n";
    return f.good();
}

bool AuditLog::append(Level level, const AuditEvent& e) {
    if (static_cast<int>(level) < min_level_.load()) return false;

    ojson fields = ojson::object();
    for (const auto& kv : e.f) fields[kv.first] = kv.second;
    fields["level"] = level_name(level);

    std::lock_guard<std::mutex> lk(mu_);

    if (prev_hash_.empty()) prev_hash_ = load_prev_hash_();

    const std::string ts = e.ts_utc.empty() ? now_iso_utc() : e.ts_utc;
    const ojson without = record_without_hash(ts, e.event, e.outcome, prev_hash_, fields);
    const std::string line_hash = sha256_hex(prev_hash_ + without.dump());
    const std::string line = record_with_hash(without, line_hash).dump();

    std::ofstream out(jsonl_path_, std::ios::app);
    if (!out.good()) {
        std::cerr << "[audit] ERROR: cannot open " << jsonl_path_ << std::endl;
        return false;
    }
    out << line << "\n";
    out.flush();
    if (!out.good()) {
        std::cerr << "[audit] ERROR: write failed " << jsonl_path_ << std::endl;
        return false;
    }

    prev_hash_ = line_hash;
    if (!store_prev_hash_(line_hash)) {
        std::cerr << "[audit] WARNING: cannot update state " << state_path_ << std::endl;
    }
    return true;
}

long AuditLog::verify_file(const std::string& jsonl_path, std::string* err,
                           const std::string& expected_head) {
    std::ifstream in(jsonl_path);
    if (!in.good()) {
        if (err) *err = "cannot open " + jsonl_path;
        return -1;
    }

    std::string prev = expected_head.empty() ? kGenesis : expected_head;
    std::string line;
    long n = 0;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        n++;

        ojson j;
        try {
            j = ojson::parse(line);
            const std::string got_prev = j.at("prev_hash").get<std::string>();
            const std::string got_hash = j.at("line_hash").get<std::string>();

            if (got_prev != prev) {
                if (err) *err = "prev_hash mismatch at line " + std::to_string(n);
                return -1;
            }

            const ojson without = record_without_hash(
                j.at("ts").get<std::string>(),
                j.at("event").get<std::string>(),
                j.at("outcome").get<std::string>(),
                got_prev,
                j.contains("f") ? j.at("f") : ojson::object());

            if (sha256_hex(got_prev + without.dump()) != got_hash) {
                if (err) *err = "line_hash mismatch at line " + std::to_string(n);
                return -1;
            }
            prev = got_hash;
        } catch (const std::exception& ex) {
            if (err) *err = "line " + std::to_string(n) + ": " + ex.what();
            return -1;
        }
    }
    return n;
}

} // namespace wxlogin
