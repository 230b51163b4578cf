// tests/config/test_config.cpp
//
// Config loading: policy flags, app entries, rejection of unusable entries,
// and that a failed load leaves the previous configuration in place.

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

#include "config.h"

using namespace wxlogin;

static int failures = 0;

static void expect(bool cond, const char* what) {
    if (!cond) {
        std::fprintf(stderr, "[config] FAIL: %s\n", what);
        failures++;
    }
}

int main() {
    {
        Config c;
        const bool ok = c.load_from_string(R"({
            "auth_sig": true,
            "sig_valid_secs": 120,
            "apps": [
                { "appid": "wx001", "secret": "s3cr3t" },
                { "appid": "wx002", "secret": "other", "session_ttl_secs": 3600,
                  "token_key_b64url": "AAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8" },
                { "appid": "bad:id", "secret": "x" },
                { "appid": "nosecret" },
                { "secret": "noappid" },
                { "appid": "wx003", "secret": "k", "token_key_b64url": "dG9vc2hvcnQ" },
                "not an object",
                { "appid": "wx001", "secret": "last-wins" }
            ]
        })");
        expect(ok, "load ok");
        expect(c.auth_sig, "auth_sig read");
        expect(c.sig_valid_secs == 120, "sig_valid_secs read");
        expect(c.size() == 2, "only valid apps kept");

        const AppInfo* a = c.find("wx001");
        expect(a && a->secret == "last-wins", "duplicate appid: last entry wins");
        expect(a && !a->has_token_key && a->session_ttl_secs == 0, "defaults");

        const AppInfo* b = c.find("wx002");
        expect(b && b->has_token_key && b->token_key[0] == 0 && b->token_key[31] == 31, "token key decoded");
        expect(b && b->session_ttl_secs == 3600, "ttl read");

        expect(!c.find("bad:id") && !c.find("nosecret") && !c.find("wx003"), "bad entries skipped");
        expect(c.find("WX001") == nullptr, "appid lookup is exact");

        // failed reload keeps the old map
        expect(!c.load_from_string("{not json"), "parse error fails");
        expect(!c.load_from_string(R"({"apps": {}})"), "apps must be array");
        expect(!c.load_from_string(R"({"apps": [], "sig_valid_secs": -1})"), "negative window fails");
        expect(!c.load_from_string(R"({"apps": [], "auth_sig": "yes"})"), "auth_sig must be bool");
        expect(c.size() == 2 && c.auth_sig && c.sig_valid_secs == 120, "state kept after failed loads");
    }

    {
        Config c;
        AppInfo app;
        std::string err;
        app.appid = "wx:1";
        app.secret = "s";
        expect(!c.add_app(app, &err) && !err.empty(), "add_app rejects ':'");
        app.appid = "wx1";
        app.secret = "";
        expect(!c.add_app(app, &err), "add_app rejects empty secret");
        app.secret = "s";
        expect(c.add_app(app, &err) && c.find("wx1"), "add_app accepts valid");
    }

    {
        Config c;
        expect(!c.load("/nonexistent/wxlogin.json"), "missing file fails");
    }

    // Wrongly typed fields skip the entry instead of aborting the load
    {
        Config c;
        bool ok = false;
        try {
            ok = c.load_from_string(R"({"apps": [
                { "appid": 1001, "secret": "x" },
                { "appid": "wx004", "secret": 7 },
                { "appid": "wx005", "secret": "s", "token_key_b64url": 12 },
                { "appid": "wx006", "secret": "s", "session_ttl_secs": "60" },
                { "appid": "wx001", "secret": "s" }
            ]})");
        } catch (const std::exception& e) {
            std::fprintf(stderr, "[config] unexpected exception: %s\n", e.what());
        }
        expect(ok, "load with mistyped entries ok");
        expect(c.size() == 1 && c.find("wx001"), "only the well-typed entry kept");
    }

    // Windows are capped so millisecond arithmetic stays in range
    {
        Config c;
        expect(!c.load_from_string(R"({"apps": [], "sig_valid_secs": 9223372036854775807})"),
               "huge sig_valid_secs fails");
        expect(c.load_from_string(R"({"apps": [], "sig_valid_secs": 315360000})"),
               "ten-year sig_valid_secs accepted");

        expect(c.load_from_string(R"({"apps": [
                { "appid": "wx007", "secret": "s", "session_ttl_secs": 9223372036854775807 },
                { "appid": "wx008", "secret": "s", "session_ttl_secs": 315360000 }
            ]})"), "load with huge ttl ok");
        expect(!c.find("wx007") && c.find("wx008"), "huge session_ttl_secs skipped");

        AppInfo app;
        app.appid = "wx009";
        app.secret = "s";
        app.session_ttl_secs = kMaxWindowSecs + 1;
        expect(!c.add_app(app), "add_app rejects ttl above cap");

        setenv("WXLOGIN_SIG_VALID_SECS", "9223372036854775807", 1);
        c.apply_env();
        expect(c.sig_valid_secs == 315360000, "huge env window ignored");
        unsetenv("WXLOGIN_SIG_VALID_SECS");
    }

    {
        Config c;
        setenv("WXLOGIN_AUTH_SIG", "1", 1);
        setenv("WXLOGIN_SIG_VALID_SECS", "42", 1);
        c.apply_env();
        expect(c.auth_sig && c.sig_valid_secs == 42, "env overrides");
        setenv("WXLOGIN_SIG_VALID_SECS", "-5", 1);
        c.apply_env();
        expect(c.sig_valid_secs == 42, "negative env window ignored");
        unsetenv("WXLOGIN_AUTH_SIG");
        unsetenv("WXLOGIN_SIG_VALID_SECS");
    }

    if (failures) {
        std::fprintf(stderr, "[config] FAILURES: %d\n", failures);
        return 1;
    }
    std::printf("[config] ALL OK\n");
    return 0;
}
