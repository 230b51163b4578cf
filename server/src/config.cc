#include "config.h"
#include "wxlogin_util.h"

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <vector>
using json = nlohmann::json;

namespace wxlogin {

static bool validate_app(const AppInfo& app, std::string& err) {
    if (app.appid.empty()) { err = "missing appid"; return false; }
    if (app.secret.empty()) { err = "missing secret for " + app.appid; return false; }
    if (app.appid.find(':') != std::string::npos) { err = "appid contains ':' " + app.appid; return false; }
    if (app.session_ttl_secs < 0 || app.session_ttl_secs > kMaxWindowSecs) {
        err = "session_ttl_secs out of range for " + app.appid;
        return false;
    }
    return true;
}

// Absent key leaves `out` untouched; present but not a string is an error.
static bool string_field(const json& a, const char* key, std::string& out) {
    if (!a.contains(key)) return true;
    const json& v = a.at(key);
    if (!v.is_string()) return false;
    out = v.get<std::string>();
    return true;
}

bool Config::add_app(const AppInfo& app, std::string* err) {
    std::string e;
    if (!validate_app(app, e)) {
        if (err) *err = e;
        return false;
    }
    apps_[app.appid] = app;
    return true;
}

const AppInfo* Config::find(const std::string& appid) const {
    auto it = apps_.find(appid);
    if (it == apps_.end()) return nullptr;
    return &it->second;
}

bool Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.good()) {
        std::cerr << "[config] file not found: " << path << std::endl;
        return false;
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return load_from_string(ss.str(), path);
}

bool Config::load_from_string(const std::string& json_text, const std::string& origin) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const std::exception& e) {
        std::cerr << "[config] parse error in " << origin << ": " << e.what() << std::endl;
        return false;
    }

    if (!j.is_object() || !j.contains("apps") || !j["apps"].is_array()) {
        std::cerr << "[config] invalid format (expected {\"apps\": [...]}) in " << origin << std::endl;
        return false;
    }

    bool auth_sig_tmp = auth_sig;
    std::int64_t sig_valid_tmp = sig_valid_secs;
    try {
        if (j.contains("auth_sig")) auth_sig_tmp = j.at("auth_sig").get<bool>();
        if (j.contains("sig_valid_secs")) sig_valid_tmp = j.at("sig_valid_secs").get<std::int64_t>();
    } catch (const std::exception& e) {
        std::cerr << "[config] invalid policy flags in " << origin << ": " << e.what() << std::endl;
        return false;
    }
    if (sig_valid_tmp < 0 || sig_valid_tmp > kMaxWindowSecs) {
        std::cerr << "[config] sig_valid_secs out of range in " << origin << std::endl;
        return false;
    }

    std::unordered_map<std::string, AppInfo> tmp;

    for (const auto& a : j["apps"]) {
        if (!a.is_object()) continue;

        AppInfo app;
        std::string key_b64;
        if (!string_field(a, "appid", app.appid) ||
            !string_field(a, "secret", app.secret) ||
            !string_field(a, "token_key_b64url", key_b64)) {
            std::cerr << "[config] WARNING: skipping app entry: appid, secret and token_key_b64url must be strings"
                      << std::endl;
            continue;
        }
        if (a.contains("session_ttl_secs")) {
            const json& t = a.at("session_ttl_secs");
            if (!t.is_number_integer()) {
                std::cerr << "[config] WARNING: skipping " << app.appid
                          << ": session_ttl_secs must be an integer" << std::endl;
                continue;
            }
            app.session_ttl_secs = t.get<std::int64_t>();
        }

        if (!key_b64.empty()) {
            std::vector<unsigned char> key;
            if (!b64url_dec(key_b64, key) || key.size() != app.token_key.size()) {
                std::cerr << "[config] WARNING: skipping " << app.appid
                          << ": token_key_b64url must decode to 32 bytes" << std::endl;
                continue;
            }
            std::copy(key.begin(), key.end(), app.token_key.begin());
            app.has_token_key = true;
        }

        std::string err;
        if (!validate_app(app, err)) {
            std::cerr << "[config] WARNING: skipping app entry: " << err << std::endl;
            continue;
        }

        // Later duplicates overwrite earlier ones; last entry wins.
        tmp[app.appid] = app;
    }

    apps_.swap(tmp);
    auth_sig = auth_sig_tmp;
    sig_valid_secs = sig_valid_tmp;

    std::cerr << "[config] loaded " << apps_.size() << " apps from " << origin
              << " (auth_sig=" << (auth_sig ? "1" : "0")
              << " sig_valid_secs=" << sig_valid_secs << ")" << std::endl;
    return true;
}

void Config::apply_env() {
    if (const char* v = std::getenv("WXLOGIN_AUTH_SIG")) auth_sig = (std::atoi(v) != 0);
    if (const char* v = std::getenv("WXLOGIN_SIG_VALID_SECS")) {
        const long long n = std::atoll(v);
        if (n >= 0 && n <= kMaxWindowSecs) sig_valid_secs = n;
        else std::cerr << "[config] WARNING: ignoring out-of-range WXLOGIN_SIG_VALID_SECS" << std::endl;
    }
}

} // namespace wxlogin
