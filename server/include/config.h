#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace wxlogin {

/*
Application configuration
=========================

One entry per mini-program application (appid). The orchestrator only reads
this; it is loaded once at startup and must not be mutated afterwards, which
is what makes concurrent lookups from request threads safe without a lock.

Expected JSON format:
{
  "auth_sig": false,
  "sig_valid_secs": 300,
  "apps": [
    { "appid": "wx001", "secret": "s3cr3t",
      "session_ttl_secs": 0,
      "token_key_b64url": "<optional, 32 bytes>" }
  ]
}
*/

// Upper bound for session_ttl_secs and sig_valid_secs (ten years). Keeps the
// millisecond arithmetic on these values inside int64.
constexpr std::int64_t kMaxWindowSecs = 10LL * 365 * 24 * 3600;

struct AppInfo {
    std::string appid;

    // Provider secret, sent to jscode2session and mixed into the token key.
    std::string secret;

    // 0 => session tokens never expire on their own.
    std::int64_t session_ttl_secs = 0;

    // Optional explicit token key. When absent the Authority derives one
    // from appid + secret.
    bool has_token_key = false;
    std::array<unsigned char, 32> token_key{};
};

class Config {
public:
    // Signature authentication required on every authenticated request.
    bool auth_sig = false;

    // Replay window for SG1 timestamps.
    std::int64_t sig_valid_secs = 300;

    /*
    Load from a JSON file. The app map is built in a temporary and swapped in
    only on success, so a failed load never leaves a partial map.

    Returns false on I/O, parse or schema errors (caller treats as fatal).
    */
    bool load(const std::string& path);

    // Same as load() but from an already-read JSON document.
    bool load_from_string(const std::string& json_text, const std::string& origin = "<string>");

    // Environment overrides: WXLOGIN_AUTH_SIG, WXLOGIN_SIG_VALID_SECS.
    void apply_env();

    // Adds or replaces an application. Rejects empty appid/secret, appids
    // containing ':' (they would break the ST1 wire form) and a
    // session_ttl_secs outside [0, kMaxWindowSecs].
    bool add_app(const AppInfo& app, std::string* err = nullptr);

    // nullptr when unknown.
    const AppInfo* find(const std::string& appid) const;

    size_t size() const { return apps_.size(); }

private:
    std::unordered_map<std::string, AppInfo> apps_;
};

} // namespace wxlogin
