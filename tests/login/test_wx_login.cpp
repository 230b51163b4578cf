// tests/login/test_wx_login.cpp
//
// WxLogin orchestration with a scripted code exchanger and a counting wrapper
// around the real SodiumAuthority. Covers the full login error table, the
// authenticate state machine, and signature-required policy.

#include <sodium.h>

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>

#include "authority.h"
#include "code2session.h"
#include "config.h"
#include "token_codec.h"
#include "wx_login.h"
#include "wxlogin_util.h"

using namespace wxlogin;

static int failures = 0;

static void expect(bool cond, const char* what) {
    if (!cond) {
        std::fprintf(stderr, "[wx_login] FAIL: %s\n", what);
        failures++;
    }
}

// Returns whatever the test put in `next`, recording the last call.
class ScriptedExchanger : public CodeExchanger {
public:
    mutable ExchangeResult next;
    mutable int calls = 0;
    mutable std::string last_appid, last_secret, last_code;

    ExchangeResult exchange(const std::string& appid,
                            const std::string& secret,
                            const std::string& code) const override {
        calls++;
        last_appid = appid;
        last_secret = secret;
        last_code = code;
        return next;
    }
};

class CountingAuthority : public Authority {
public:
    SodiumAuthority inner;
    mutable std::atomic<int> make_calls{0};
    mutable std::atomic<int> session_calls{0};
    mutable std::atomic<int> sig_calls{0};

    AuthorityResult make_client_session(const AppInfo& app, const std::string& openid,
                                        const ProviderSessionKey& key, ClientSession& out) const override {
        make_calls++;
        return inner.make_client_session(app, openid, key, out);
    }

    AuthorityResult auth_client_session(const AppInfo& app, const std::string& openid,
                                        const std::string& token, Secret& out) const override {
        session_calls++;
        return inner.auth_client_session(app, openid, token, out);
    }

    AuthorityResult auth_client_sig(const AppInfo& app, const std::string& key_text,
                                    const std::string& uri, const std::string& ts_ms,
                                    const std::string& nonce, const std::string& sig,
                                    const ReplayCheck& replay_ok) const override {
        sig_calls++;
        return inner.auth_client_sig(app, key_text, uri, ts_ms, nonce, sig, replay_ok);
    }
};

static std::string b64_of(const std::string& raw) {
    return b64_std(reinterpret_cast<const unsigned char*>(raw.data()), raw.size());
}

static ExchangeResult provider_ok(const std::string& openid, const std::string& session_key_b64) {
    ExchangeResult r;
    r.rc = ExchangeRc::OK;
    r.openid = openid;
    r.session_key = session_key_b64;
    return r;
}

static std::shared_ptr<Config> make_config(bool auth_sig) {
    auto cfg = std::make_shared<Config>();
    AppInfo app;
    app.appid = "wx001";
    app.secret = "s3cr3t";
    if (!cfg->add_app(app)) std::fprintf(stderr, "[wx_login] add_app failed\n");
    cfg->auth_sig = auth_sig;
    cfg->sig_valid_secs = 300;
    return cfg;
}

int main() {
    if (sodium_init() < 0) {
        std::fprintf(stderr, "[wx_login] sodium_init failed\n");
        return 2;
    }

    auto exch = std::make_shared<ScriptedExchanger>();
    auto auth = std::make_shared<CountingAuthority>();

    // ---------------------------------------------------------------------
    // Login without signature policy
    // ---------------------------------------------------------------------
    {
        WxLogin login(make_config(false), auth, exch);

        // Concrete scenario
        exch->next = provider_ok("u1", b64_of("0123456789ABCDEF"));
        const LoginResult lr = login.handle_login("wx001", "code1");
        expect(lr.ok, "login ok");
        expect(exch->last_appid == "wx001" && exch->last_secret == "s3cr3t" && exch->last_code == "code1",
               "exchanger got appid/secret/code");
        expect(lr.value.openid == "u1", "openid returned");
        expect(lr.value.stoken.rfind("ST1:wx001:u1:", 0) == 0, "stoken prefix");
        expect(!lr.value.skey.empty(), "skey returned");

        SessionTokenParts p;
        expect(decode_session_token(lr.value.stoken, p).ok(), "stoken decodes");
        expect(p.appid == "wx001" && p.openid == "u1", "stoken round trips appid/openid");
        expect(lr.value.stoken == "ST1:wx001:u1:" + p.token, "stoken is exactly ST1:appid:openid:token");

        // authenticate, no signature needed, any uri, sig unavailable is fine
        const AuthResult a1 = login.authenticate(lr.value.stoken, "/any", SigInput::unavailable("no header"));
        expect(a1.ok, "authenticate ok");
        expect(a1.info && a1.info->appid == "wx001" && a1.info->openid == "u1", "identity");
        expect(a1.info && !a1.info->sig_authed, "sig_authed false");
        expect(a1.info && b64_std(a1.info->secret.client_sess_key.data(),
                                  a1.info->secret.client_sess_key.size()) == lr.value.skey,
               "secret matches skey");

        // idempotent
        const AuthResult a2 = login.authenticate(lr.value.stoken, "/other", SigInput::of("ignored"));
        expect(a2.ok && a2.info->appid == a1.info->appid && a2.info->openid == a1.info->openid &&
               a2.info->sig_authed == a1.info->sig_authed, "repeat authenticate identical");

        // shared immutable info
        LoginInfo copy = a1.info;
        expect(copy.get() == a1.info.get() && copy.use_count() >= 2, "LoginInfo shares ownership");

        // unknown appid: no provider call
        const int before = exch->calls;
        LoginResult e = login.handle_login("wx999", "code1");
        expect(!e.ok && e.error.status == 401 && e.error.code == "appid-not-found", "appid-not-found");
        expect(e.error.message == kLoginFailMsg, "fixed message");
        expect(exch->calls == before, "no exchange for unknown appid");

        // transport failure
        exch->next = ExchangeResult{};
        exch->next.rc = ExchangeRc::CALL_FAIL;
        exch->next.detail = "http error: Connection";
        e = login.handle_login("wx001", "code1");
        expect(!e.ok && e.error.status == 500 && e.error.code == "jscode2session-call-fail", "call-fail");
        expect(e.error.detail == "http error: Connection", "call-fail detail carried");
        expect(e.error.message == kLoginFailMsg, "call-fail fixed message");

        // response failure
        exch->next = ExchangeResult{};
        exch->next.rc = ExchangeRc::RESP_FAIL;
        exch->next.detail = "errcode=40029 errmsg=invalid code";
        e = login.handle_login("wx001", "code1");
        expect(!e.ok && e.error.status == 401 && e.error.code == "jscode2session-resp-fail", "resp-fail");

        // openid unusable in the wire form
        exch->next = provider_ok("u:1", b64_of("0123456789ABCDEF"));
        e = login.handle_login("wx001", "code1");
        expect(!e.ok && e.error.code == "jscode2session-resp-fail", "openid with ':' rejected");

        // invalid base64 / wrong length share one code
        const int makes_before = auth->make_calls.load();
        for (const std::string& bad : {std::string("not base64!!"),
                                       b64_of("short"),
                                       b64_of("0123456789ABCDEF0"),
                                       std::string(""),
                                       std::string("MDEyMzQ1Njc4OUFCQ0RFRg")}) { // unpadded
            exch->next = provider_ok("u1", bad);
            e = login.handle_login("wx001", "code1");
            expect(!e.ok && e.error.status == 500 && e.error.code == "session-key-invalid-base64",
                   "session-key-invalid-base64");
        }
        expect(auth->make_calls.load() == makes_before, "no session derived for bad keys");

        exch->next = provider_ok("u1", b64_of("short"));
        e = login.handle_login("wx001", "code1");
        expect(e.error.detail == "unexpected key len: 5", "length detail");
    }

    // ---------------------------------------------------------------------
    // authenticate rejections (no signature policy)
    // ---------------------------------------------------------------------
    {
        WxLogin login(make_config(false), auth, exch);
        exch->next = provider_ok("u1", b64_of("0123456789ABCDEF"));
        const LoginResult lr = login.handle_login("wx001", "code1");
        expect(lr.ok, "login for rejection tests");

        SessionTokenParts p;
        expect(decode_session_token(lr.value.stoken, p).ok(), "decode for rejection tests");

        const int calls_before = auth->session_calls.load();

        AuthResult a = login.authenticate("ST2:wx001:u1:" + p.token, "/", SigInput::of("x"));
        expect(!a.ok && !a.info, "tampered tag rejected");
        expect(a.detail == "bad stoken tag:ST2", "tag detail");

        a = login.authenticate("ST1:wx001:u1", "/", SigInput::of("x"));
        expect(!a.ok && a.detail == "bad stoken format", "short token rejected");

        a = login.authenticate("ST1:wx404:u1:" + p.token, "/", SigInput::of("x"));
        expect(!a.ok && a.detail == "appid not found", "unknown appid rejected");

        expect(auth->session_calls.load() == calls_before, "no Authority call before app resolves");

        a = login.authenticate("ST1:wx001:u2:" + p.token, "/", SigInput::of("x"));
        expect(!a.ok, "token moved to other openid rejected");
        expect(auth->session_calls.load() == calls_before + 1, "Authority consulted once");
    }

    // ---------------------------------------------------------------------
    // Signature required
    // ---------------------------------------------------------------------
    {
        WxLogin login(make_config(true), auth, exch);
        exch->next = provider_ok("u1", b64_of("0123456789ABCDEF"));
        const LoginResult lr = login.handle_login("wx001", "code1");
        expect(lr.ok, "login with sig policy");

        const std::string uri = "/api/whoami?x=1";
        const std::int64_t now = now_epoch_ms();

        AuthResult a = login.authenticate(lr.value.stoken, uri,
                                          SigInput::of(make_sig_token(lr.value.skey, uri, now, "n1")));
        expect(a.ok && a.info->sig_authed, "valid signature -> sig_authed");

        // missing signature is a hard failure that keeps its reason
        a = login.authenticate(lr.value.stoken, uri, SigInput::unavailable("missing X-WX-Sig header"));
        expect(!a.ok && a.detail == "missing X-WX-Sig header", "missing sig reason propagated");

        a = login.authenticate(lr.value.stoken, uri, SigInput::of("SG1:1:2"));
        expect(!a.ok && a.detail == "bad sig format", "bad sig format");

        a = login.authenticate(lr.value.stoken, uri, SigInput::of("SG2:1:2:3"));
        expect(!a.ok && a.detail == "bad sig tag:SG2", "bad sig tag");

        // stale but otherwise well-formed and correctly keyed
        a = login.authenticate(lr.value.stoken, uri,
                               SigInput::of(make_sig_token(lr.value.skey, uri, now - 600 * 1000, "n2")));
        expect(!a.ok && a.detail == "signature expired", "stale signature rejected");

        // signed for another uri
        a = login.authenticate(lr.value.stoken, uri,
                               SigInput::of(make_sig_token(lr.value.skey, "/elsewhere", now, "n3")));
        expect(!a.ok && a.detail == "signature mismatch", "uri binding");

        // signed with another user's key
        exch->next = provider_ok("u2", b64_of("FEDCBA9876543210"));
        const LoginResult lr2 = login.handle_login("wx001", "code2");
        expect(lr2.ok, "second user login");
        a = login.authenticate(lr.value.stoken, uri,
                               SigInput::of(make_sig_token(lr2.value.skey, uri, now, "n4")));
        expect(!a.ok && a.detail == "signature mismatch", "cross-user key rejected");
    }

    // Missing collaborators are a programming error
    {
        bool threw = false;
        try {
            WxLogin bad(make_config(false), nullptr, exch);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect(threw, "null authority rejected");
    }

    if (failures) {
        std::fprintf(stderr, "[wx_login] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[wx_login] ALL OK\n");
    return 0;
}
