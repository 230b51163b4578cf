#include "token_codec.h"
#include "wxlogin_util.h"

#include <array>
#include <vector>

/*
 * token_codec.cc
 *
 * Structural encode/decode of the two colon-delimited client tokens.
 * Nothing here is cryptographic: the session token's last field is opaque
 * and is verified by the Authority; the signature token's fields are checked
 * by Authority::auth_client_sig.
 *
 * Decode order matters for diagnostics: field count is checked before the tag,
 * so "ST1:a:b" is a format error while "ST2:a:b:c" is a tag error.
 */

namespace wxlogin {

static bool component_ok(const std::string& s) {
    return !s.empty() && s.find(kTokenSep) == std::string::npos;
}

static std::string join4(const char* tag,
                         const std::string& a,
                         const std::string& b,
                         const std::string& c) {
    std::string out = tag;
    out.reserve(out.size() + a.size() + b.size() + c.size() + 3);
    out += kTokenSep;
    out += a;
    out += kTokenSep;
    out += b;
    out += kTokenSep;
    out += c;
    return out;
}

// Split into exactly four non-empty fields and check the tag.
static TokenDecodeResult split4(const std::string& s,
                                const char* tag,
                                const char* what, // "stoken" / "sig"
                                std::array<std::string, 3>& fields) {
    TokenDecodeResult r;

    const std::vector<std::string> parts = split_char(s, kTokenSep);
    if (parts.size() != 4) {
        r.rc = TokenRc::BAD_FORMAT;
        r.detail = std::string("bad ") + what + " format";
        return r;
    }
    for (const auto& p : parts) {
        if (p.empty()) {
            r.rc = TokenRc::BAD_FORMAT;
            r.detail = std::string("bad ") + what + " format";
            return r;
        }
    }

    if (parts[0] != tag) {
        r.rc = TokenRc::BAD_TAG;
        r.detail = std::string("bad ") + what + " tag:" + parts[0];
        return r;
    }

    fields[0] = parts[1];
    fields[1] = parts[2];
    fields[2] = parts[3];

    r.rc = TokenRc::OK;
    return r;
}

bool encode_session_token(const std::string& appid,
                          const std::string& openid,
                          const std::string& token,
                          std::string& out) {
    if (!component_ok(appid) || !component_ok(openid) || !component_ok(token)) return false;
    out = join4(kSessionTag, appid, openid, token);
    return true;
}

bool encode_sig_token(const std::string& ts_ms,
                      const std::string& nonce,
                      const std::string& sig,
                      std::string& out) {
    if (!component_ok(ts_ms) || !component_ok(nonce) || !component_ok(sig)) return false;
    out = join4(kSigTag, ts_ms, nonce, sig);
    return true;
}

TokenDecodeResult decode_session_token(const std::string& s, SessionTokenParts& out) {
    std::array<std::string, 3> f;
    TokenDecodeResult r = split4(s, kSessionTag, "stoken", f);
    if (!r.ok()) return r;

    out.appid  = f[0];
    out.openid = f[1];
    out.token  = f[2];
    return r;
}

TokenDecodeResult decode_sig_token(const std::string& s, SigTokenParts& out) {
    std::array<std::string, 3> f;
    TokenDecodeResult r = split4(s, kSigTag, "sig", f);
    if (!r.ok()) return r;

    out.ts_ms = f[0];
    out.nonce = f[1];
    out.sig   = f[2];
    return r;
}

} // namespace wxlogin
