#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "config.h"

namespace wxlogin {

// Raw WeChat session_key after base64 decoding.
using ProviderSessionKey = std::array<unsigned char, 16>;

// Handed to the client once, at login.
struct ClientSession {
    std::string sess_token; // opaque, goes into ST1:<appid>:<openid>:<sess_token>
    std::string sess_key;   // skey: standard base64 of client_sess_key
};

// Server-side view of a verified session, re-derived on every request.
struct Secret {
    ProviderSessionKey session_key{};
    std::array<unsigned char, 32> client_sess_key{};
    std::int64_t issued_at_ms = 0;
};

// Replay predicate for SG1 timestamps: receives |now - ts| and the nonce.
using ReplayCheck = std::function<bool(std::chrono::milliseconds age, const std::string& nonce)>;

enum class AuthorityRc : int {
    OK = 0,

    SESSION_INVALID = 30,
    SESSION_EXPIRED = 31,

    SIG_TS_INVALID = 40,
    SIG_EXPIRED = 41,
    SIG_MISMATCH = 42,

    CRYPTO = 90,
    INTERNAL = 99,
};

struct AuthorityResult {
    bool ok = false;
    AuthorityRc rc = AuthorityRc::INTERNAL;
    std::string detail; // short, no secrets
};

/*
Authority
=========

Key derivation and MAC verification for one deployment. Everything above this
interface (token wire forms, orchestration, error mapping) is independent of
the scheme, so an alternative derivation can be dropped in by implementing
these three calls.

Implementations must be stateless between calls and safe to use from many
request threads at once.
*/
class Authority {
public:
    virtual ~Authority() = default;

    // Derive the client session for a fresh provider session_key.
    virtual AuthorityResult make_client_session(const AppInfo& app,
                                                const std::string& openid,
                                                const ProviderSessionKey& session_key,
                                                ClientSession& out) const = 0;

    // Check that token belongs to (app, openid) and recover the Secret.
    virtual AuthorityResult auth_client_session(const AppInfo& app,
                                                const std::string& openid,
                                                const std::string& token,
                                                Secret& out) const = 0;

    // Verify an SG1 signature over (ts_ms, nonce, uri) keyed by the
    // client session key text (what the client holds as skey).
    virtual AuthorityResult auth_client_sig(const AppInfo& app,
                                            const std::string& client_sess_key_text,
                                            const std::string& uri,
                                            const std::string& ts_ms,
                                            const std::string& nonce,
                                            const std::string& sig,
                                            const ReplayCheck& replay_ok) const = 0;
};

/*
SodiumAuthority
===============

  master     = token_key (config) or SHA-256("wxlogin/v1|" appid "|" secret)
  seal_key   = HMAC-SHA256(master, "seal")
  csk_key    = HMAC-SHA256(master, "csk")

  sess_token = b64url( npub24 || XChaCha20-Poly1305(seal_key, npub24,
                         m  = session_key16 || issued_at_ms_be64,
                         ad = appid ":" openid) )
  client_sess_key = HMAC-SHA256(csk_key, openid || session_key16)
  skey            = b64_std(client_sess_key)

  sig = b64url( HMAC-SHA256(key = skey bytes, ts_ms ":" nonce ":" uri) )

Requires sodium_init() before first use.
*/
class SodiumAuthority : public Authority {
public:
    // now_ms: clock override for tests; empty => wall clock.
    explicit SodiumAuthority(std::function<std::int64_t()> now_ms = nullptr);

    AuthorityResult make_client_session(const AppInfo& app,
                                        const std::string& openid,
                                        const ProviderSessionKey& session_key,
                                        ClientSession& out) const override;

    AuthorityResult auth_client_session(const AppInfo& app,
                                        const std::string& openid,
                                        const std::string& token,
                                        Secret& out) const override;

    AuthorityResult auth_client_sig(const AppInfo& app,
                                    const std::string& client_sess_key_text,
                                    const std::string& uri,
                                    const std::string& ts_ms,
                                    const std::string& nonce,
                                    const std::string& sig,
                                    const ReplayCheck& replay_ok) const override;

private:
    std::int64_t now_ms() const;

    std::function<std::int64_t()> now_ms_;
};

// Client-side signing: the value a mini-program sends in X-WX-Sig.
// Returns "SG1:<ts_ms>:<nonce>:<sig>", or "" if nonce is empty or contains ':'.
std::string make_sig_token(const std::string& client_sess_key_text,
                           const std::string& uri,
                           std::int64_t ts_ms,
                           const std::string& nonce);

} // namespace wxlogin
