#include "wx_login.h"

#include "audit_fields.h"
#include "token_codec.h"
#include "wxlogin_util.h"

#include <sodium.h>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace wxlogin {

static LoginResult login_fail(int status, const char* code, const std::string& detail = "") {
    LoginResult r;
    r.ok = false;
    r.error.status = status;
    r.error.code = code;
    r.error.message = kLoginFailMsg;
    r.error.detail = detail;
    return r;
}

static AuthResult auth_fail(const std::string& detail) {
    AuthResult r;
    r.ok = false;
    r.detail = detail;
    return r;
}

WxLogin::WxLogin(std::shared_ptr<const Config> cfg,
                 std::shared_ptr<const Authority> authority,
                 std::shared_ptr<const CodeExchanger> exchanger)
    : cfg_(std::move(cfg)),
      authority_(std::move(authority)),
      exchanger_(std::move(exchanger)) {
    if (!cfg_ || !authority_ || !exchanger_) {
        throw std::invalid_argument("WxLogin: config, authority and exchanger are required");
    }
}

LoginResult WxLogin::handle_login(const std::string& appid, const std::string& code) const {
    std::cerr << "[wx_login] handle_login appid=" << appid
              << " code=" << redact(code) << std::endl;

    // 1) Application
    const AppInfo* app = cfg_->find(appid);
    if (!app) return login_fail(401, "appid-not-found");

    // 2) Code exchange (the only I/O on this path)
    const ExchangeResult ex = exchanger_->exchange(appid, app->secret, code);
    if (ex.rc == ExchangeRc::CALL_FAIL) return login_fail(500, "jscode2session-call-fail", ex.detail);
    if (!ex.ok()) return login_fail(401, "jscode2session-resp-fail", ex.detail);

    // openid goes into the ST1 wire form verbatim.
    if (ex.openid.empty() || ex.openid.find(kTokenSep) != std::string::npos) {
        return login_fail(401, "jscode2session-resp-fail", "unusable openid");
    }

    // 3) session_key: standard base64 of exactly 16 bytes. Both failure kinds
    // share one code.
    std::vector<unsigned char> key_bytes;
    if (!b64_std_dec(ex.session_key, key_bytes)) {
        return login_fail(500, "session-key-invalid-base64", "invalid base64");
    }
    if (key_bytes.size() != sizeof(ProviderSessionKey)) {
        const size_t n = key_bytes.size();
        sodium_memzero(key_bytes.data(), key_bytes.size());
        return login_fail(500, "session-key-invalid-base64", "unexpected key len: " + std::to_string(n));
    }

    ProviderSessionKey session_key{};
    std::copy(key_bytes.begin(), key_bytes.end(), session_key.begin());
    sodium_memzero(key_bytes.data(), key_bytes.size());

    // 4) Client session
    ClientSession cs;
    const AuthorityResult ar = authority_->make_client_session(*app, ex.openid, session_key, cs);
    sodium_memzero(session_key.data(), session_key.size());
    if (!ar.ok) return login_fail(500, "session-make-fail", ar.detail);

    // 5) Wire token
    std::string stoken;
    if (!encode_session_token(appid, ex.openid, cs.sess_token, stoken)) {
        return login_fail(500, "session-make-fail", "session token not encodable");
    }

    std::cerr << "[wx_login] login ok appid=" << appid
              << " openid=" << shorten(ex.openid, 12) << std::endl;

    LoginResult r;
    r.ok = true;
    r.value.openid = ex.openid;
    r.value.stoken = std::move(stoken);
    r.value.skey = std::move(cs.sess_key);
    return r;
}

AuthResult WxLogin::authenticate(const std::string& stoken,
                                 const std::string& uri,
                                 const SigInput& sig) const {
    // Parsed
    SessionTokenParts st;
    const TokenDecodeResult dr = decode_session_token(stoken, st);
    if (!dr.ok()) return auth_fail(dr.detail);

    // AppResolved
    const AppInfo* app = cfg_->find(st.appid);
    if (!app) return auth_fail("appid not found");

    // SessionVerified
    Secret secret;
    const AuthorityResult sr = authority_->auth_client_session(*app, st.openid, st.token, secret);
    if (!sr.ok) return auth_fail(sr.detail);

    // SignatureVerified (only when required)
    bool sig_authed = false;
    if (cfg_->auth_sig) {
        if (!sig.present) return auth_fail(sig.text.empty() ? std::string("missing sig") : sig.text);

        SigTokenParts sg;
        const TokenDecodeResult gr = decode_sig_token(sig.text, sg);
        if (!gr.ok()) return auth_fail(gr.detail);

        const std::chrono::milliseconds window =
            std::chrono::seconds(cfg_->sig_valid_secs);
        const ReplayCheck fresh = [window](std::chrono::milliseconds age, const std::string&) {
            return age <= window;
        };

        const std::string key_text = b64_std(secret.client_sess_key.data(), secret.client_sess_key.size());
        const AuthorityResult gr2 = authority_->auth_client_sig(*app, key_text, uri,
                                                                sg.ts_ms, sg.nonce, sg.sig, fresh);
        if (!gr2.ok) return auth_fail(gr2.detail);
        sig_authed = true;
    }

    // Authenticated
    auto info = std::make_shared<LoginInfoData>();
    info->appid = st.appid;
    info->openid = st.openid;
    info->secret = secret;
    info->sig_authed = sig_authed;

    AuthResult r;
    r.ok = true;
    r.info = std::move(info);
    return r;
}

} // namespace wxlogin
