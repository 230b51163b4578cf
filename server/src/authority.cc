#include "authority.h"
#include "token_codec.h"
#include "wxlogin_util.h"

/*
 * authority.cc
 *
 * libsodium implementation of the session/signature Authority.
 *
 * Security properties:
 * - sess_token is AEAD-sealed, not just MACed: the provider session_key
 *   never appears in clear on the client, and the appid/openid pair is bound
 *   as associated data, so a token cannot be replayed under another user.
 * - Nothing is stored server-side; the Secret is recovered from the token.
 * - All MAC comparisons are constant time (sodium_memcmp).
 *
 * Hard requirement:
 * - sodium_init() must have succeeded before any call.
 */

#include <sodium.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <utility>
#include <vector>

namespace wxlogin {

static constexpr size_t kNpubLen = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
static constexpr size_t kMacLen = crypto_aead_xchacha20poly1305_ietf_ABYTES;
static constexpr size_t kPlainLen = sizeof(ProviderSessionKey) + 8;
static constexpr size_t kTokenBinLen = kNpubLen + kPlainLen + kMacLen;

static AuthorityResult ok_result() {
    AuthorityResult r;
    r.ok = true;
    r.rc = AuthorityRc::OK;
    return r;
}

static AuthorityResult fail(AuthorityRc rc, const std::string& detail) {
    AuthorityResult r;
    r.ok = false;
    r.rc = rc;
    r.detail = detail;
    return r;
}

// HMAC-SHA256 with an arbitrary-length key.
static void hmac_sha256(const unsigned char* key, size_t key_len,
                        const unsigned char* msg, size_t msg_len,
                        unsigned char out[crypto_auth_hmacsha256_BYTES]) {
    crypto_auth_hmacsha256_state st;
    crypto_auth_hmacsha256_init(&st, key, key_len);
    crypto_auth_hmacsha256_update(&st, msg, msg_len);
    crypto_auth_hmacsha256_final(&st, out);
}

static void hmac_sha256_str(const unsigned char* key, size_t key_len,
                            const std::string& msg,
                            unsigned char out[crypto_auth_hmacsha256_BYTES]) {
    hmac_sha256(key, key_len,
                reinterpret_cast<const unsigned char*>(msg.data()), msg.size(),
                out);
}

// Per-app key material. Wiped by the destructor.
struct AppKeys {
    unsigned char seal[crypto_aead_xchacha20poly1305_ietf_KEYBYTES];
    unsigned char csk[crypto_auth_hmacsha256_BYTES];

    explicit AppKeys(const AppInfo& app) {
        unsigned char master[crypto_hash_sha256_BYTES];
        if (app.has_token_key) {
            std::memcpy(master, app.token_key.data(), sizeof(master));
        } else {
            const std::string label = "wxlogin/v1|" + app.appid + "|" + app.secret;
            crypto_hash_sha256(master,
                               reinterpret_cast<const unsigned char*>(label.data()),
                               label.size());
        }

        static_assert(sizeof(seal) == crypto_auth_hmacsha256_BYTES, "seal key size");
        hmac_sha256_str(master, sizeof(master), "seal", seal);
        hmac_sha256_str(master, sizeof(master), "csk", csk);
        sodium_memzero(master, sizeof(master));
    }

    ~AppKeys() {
        sodium_memzero(seal, sizeof(seal));
        sodium_memzero(csk, sizeof(csk));
    }

    AppKeys(const AppKeys&) = delete;
    AppKeys& operator=(const AppKeys&) = delete;
};

static std::string session_ad(const AppInfo& app, const std::string& openid) {
    return app.appid + ":" + openid;
}

static void derive_client_sess_key(const AppKeys& keys,
                                   const std::string& openid,
                                   const ProviderSessionKey& session_key,
                                   std::array<unsigned char, 32>& out) {
    std::string msg = openid;
    msg.append(reinterpret_cast<const char*>(session_key.data()), session_key.size());
    hmac_sha256_str(keys.csk, sizeof(keys.csk), msg, out.data());
    sodium_memzero(msg.data(), msg.size());
}

static void put_be64(unsigned char* p, std::int64_t v) {
    const std::uint64_t u = (std::uint64_t)v;
    for (int i = 0; i < 8; i++) p[i] = (unsigned char)(u >> (56 - 8 * i));
}

static std::int64_t get_be64(const unsigned char* p) {
    std::uint64_t u = 0;
    for (int i = 0; i < 8; i++) u = (u << 8) | p[i];
    return (std::int64_t)u;
}

// Strict base-10, optional leading '-', whole string consumed.
static bool parse_i64(const std::string& s, std::int64_t& out) {
    if (s.empty() || s.size() > 20) return false;
    for (size_t i = 0; i < s.size(); i++) {
        const char c = s[i];
        if (c == '-' && i == 0 && s.size() > 1) continue;
        if (c < '0' || c > '9') return false;
    }
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return false;
    out = (std::int64_t)v;
    return true;
}

static std::string sig_b64url(const std::string& key_text,
                              const std::string& ts_ms,
                              const std::string& nonce,
                              const std::string& uri) {
    unsigned char mac[crypto_auth_hmacsha256_BYTES];
    hmac_sha256_str(reinterpret_cast<const unsigned char*>(key_text.data()), key_text.size(),
                    ts_ms + ":" + nonce + ":" + uri, mac);
    return b64url_enc(mac, sizeof(mac));
}

// -----------------------------------------------------------------------------
// SodiumAuthority
// -----------------------------------------------------------------------------

SodiumAuthority::SodiumAuthority(std::function<std::int64_t()> now_ms)
    : now_ms_(std::move(now_ms)) {}

std::int64_t SodiumAuthority::now_ms() const {
    return now_ms_ ? now_ms_() : now_epoch_ms();
}

AuthorityResult SodiumAuthority::make_client_session(const AppInfo& app,
                                                     const std::string& openid,
                                                     const ProviderSessionKey& session_key,
                                                     ClientSession& out) const {
    if (openid.empty()) return fail(AuthorityRc::INTERNAL, "empty openid");

    const AppKeys keys(app);

    unsigned char plain[kPlainLen];
    std::memcpy(plain, session_key.data(), session_key.size());
    put_be64(plain + session_key.size(), now_ms());

    unsigned char bin[kTokenBinLen];
    randombytes_buf(bin, kNpubLen);

    const std::string ad = session_ad(app, openid);
    unsigned long long clen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        bin + kNpubLen, &clen,
        plain, sizeof(plain),
        reinterpret_cast<const unsigned char*>(ad.data()), ad.size(),
        /*nsec=*/nullptr,
        bin, keys.seal);
    sodium_memzero(plain, sizeof(plain));

    if (rc != 0 || clen != kPlainLen + kMacLen) {
        return fail(AuthorityRc::CRYPTO, "aead encrypt failed");
    }

    std::array<unsigned char, 32> csk{};
    derive_client_sess_key(keys, openid, session_key, csk);

    out.sess_token = b64url_enc(bin, sizeof(bin));
    out.sess_key = b64_std(csk.data(), csk.size());
    sodium_memzero(csk.data(), csk.size());

    return ok_result();
}

AuthorityResult SodiumAuthority::auth_client_session(const AppInfo& app,
                                                     const std::string& openid,
                                                     const std::string& token,
                                                     Secret& out) const {
    std::vector<unsigned char> bin;
    if (!b64url_dec(token, bin) || bin.size() != kTokenBinLen) {
        return fail(AuthorityRc::SESSION_INVALID, "session token verify failed");
    }

    const AppKeys keys(app);

    unsigned char plain[kPlainLen];
    unsigned long long plen = 0;
    const std::string ad = session_ad(app, openid);
    if (crypto_aead_xchacha20poly1305_ietf_decrypt(
            plain, &plen,
            /*nsec=*/nullptr,
            bin.data() + kNpubLen, bin.size() - kNpubLen,
            reinterpret_cast<const unsigned char*>(ad.data()), ad.size(),
            bin.data(), keys.seal) != 0 || plen != kPlainLen) {
        return fail(AuthorityRc::SESSION_INVALID, "session token verify failed");
    }

    Secret s;
    std::memcpy(s.session_key.data(), plain, s.session_key.size());
    s.issued_at_ms = get_be64(plain + s.session_key.size());
    sodium_memzero(plain, sizeof(plain));

    if (app.session_ttl_secs > 0) {
        const std::int64_t age_ms = now_ms() - s.issued_at_ms;
        if (age_ms > app.session_ttl_secs * 1000) {
            sodium_memzero(s.session_key.data(), s.session_key.size());
            return fail(AuthorityRc::SESSION_EXPIRED, "session token expired");
        }
    }

    derive_client_sess_key(keys, openid, s.session_key, s.client_sess_key);
    out = s;
    return ok_result();
}

AuthorityResult SodiumAuthority::auth_client_sig(const AppInfo& app,
                                                 const std::string& client_sess_key_text,
                                                 const std::string& uri,
                                                 const std::string& ts_ms,
                                                 const std::string& nonce,
                                                 const std::string& sig,
                                                 const ReplayCheck& replay_ok) const {
    (void)app; // the key text is already bound to the app via client_sess_key

    std::int64_t ts = 0;
    if (!parse_i64(ts_ms, ts) || ts < 0) {
        return fail(AuthorityRc::SIG_TS_INVALID, "bad sig timestamp");
    }

    // Both operands are non-negative, so the difference and its negation fit.
    const std::int64_t now = now_ms();
    if (now < 0) return fail(AuthorityRc::INTERNAL, "clock before epoch");
    std::int64_t age = now - ts;
    if (age < 0) age = -age;

    if (!replay_ok || !replay_ok(std::chrono::milliseconds(age), nonce)) {
        return fail(AuthorityRc::SIG_EXPIRED, "signature expired");
    }

    const std::string expected = sig_b64url(client_sess_key_text, ts_ms, nonce, uri);
    if (sig.size() != expected.size() ||
        sodium_memcmp(sig.data(), expected.data(), expected.size()) != 0) {
        return fail(AuthorityRc::SIG_MISMATCH, "signature mismatch");
    }

    return ok_result();
}

std::string make_sig_token(const std::string& client_sess_key_text,
                           const std::string& uri,
                           std::int64_t ts_ms,
                           const std::string& nonce) {
    const std::string ts = std::to_string(ts_ms);
    std::string out;
    if (!encode_sig_token(ts, nonce, sig_b64url(client_sess_key_text, ts, nonce, uri), out)) {
        return "";
    }
    return out;
}

} // namespace wxlogin
