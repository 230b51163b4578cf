/*
wxlogin server
==============

Login and session authentication for WeChat mini-program clients.

Flow
----
1) The mini-program calls wx.login() and POSTs {appid, code} to /api/login.
2) The server exchanges code at jscode2session for (openid, session_key),
   seals session_key into an opaque session token and returns
     stoken = "ST1:<appid>:<openid>:<token>"  and  skey (signing key).
3) Every later request carries X-WX-Stoken, and X-WX-Sig when signatures are
   required: "SG1:<ts_ms>:<nonce>:<b64url(HMAC-SHA256(skey, ts:nonce:uri))>".
4) The server re-derives everything from the token; there is no session table.

Configuration
-------------
  WXLOGIN_CONFIG_PATH        apps/policy JSON (default config/wxlogin.json)
  WXLOGIN_LISTEN_PORT        default 8082
  WXLOGIN_AUTH_SIG           0/1, overrides "auth_sig"
  WXLOGIN_SIG_VALID_SECS     overrides "sig_valid_secs"
  WXLOGIN_CODE2SESSION_URL   provider endpoint override (proxies, tests)
  WXLOGIN_AUDIT_DIR          default <exe_dir>/audit
  WXLOGIN_AUDIT_MIN_LEVEL    DEBUG|INFO|ADMIN|SECURITY (default INFO)

Failure to initialize libsodium or load the config is fatal; everything after
startup fails per request only.
*/

#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits.h>
#include <map>
#include <memory>
#include <string>
#include <unistd.h>

#include <sodium.h>

#include "audit_log.h"
#include "authority.h"
#include "code2session.h"
#include "config.h"
#include "routes_login.h"
#include "wx_login.h"

// header-only HTTP server
#include "httplib.h"

static int LISTEN_PORT = 8082;

static std::string exe_dir() {
    char buf[PATH_MAX];
    const ssize_t n = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
    if (n <= 0) return ".";
    buf[n] = '\0';
    return std::filesystem::path(buf).parent_path().string();
}

int main()
{
    if (sodium_init() < 0) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    // ---- config ----
    std::string config_path = "config/wxlogin.json";
    if (const char* p = std::getenv("WXLOGIN_CONFIG_PATH")) config_path = p;
    if (const char* v = std::getenv("WXLOGIN_LISTEN_PORT")) LISTEN_PORT = std::atoi(v);

    auto cfg = std::make_shared<wxlogin::Config>();
    if (!cfg->load(config_path)) {
        std::cerr << "[config] FATAL: failed to load " << config_path << std::endl;
        return 2;
    }
    cfg->apply_env();
    if (cfg->size() == 0) {
        std::cerr << "[config] WARNING: no apps configured; every login will fail with appid-not-found" << std::endl;
    }

    wxlogin::HttpExchangerOptions xopt;
    if (const char* u = std::getenv("WXLOGIN_CODE2SESSION_URL")) xopt.url = u;

    // ---- audit log (hash-chained JSONL) ----
    std::string audit_dir = exe_dir() + "/audit";
    if (const char* d = std::getenv("WXLOGIN_AUDIT_DIR")) audit_dir = d;
    try {
        std::filesystem::create_directories(audit_dir);
    } catch (const std::exception& e) {
        std::cerr << "[audit] WARNING: create_directories failed: " << e.what() << std::endl;
    }

    wxlogin::AuditLog audit(audit_dir + "/wxlogin_audit.jsonl", audit_dir + "/wxlogin_audit.state");
    if (const char* lv = std::getenv("WXLOGIN_AUDIT_MIN_LEVEL")) {
        if (!audit.set_min_level_str(lv)) {
            std::cerr << "[audit] WARNING: invalid WXLOGIN_AUDIT_MIN_LEVEL=" << lv << std::endl;
        }
    }
    std::cerr << "[audit] min_level=" << audit.min_level_str() << std::endl;

    // ---- core ----
    const wxlogin::WxLogin login(cfg,
                                 std::make_shared<wxlogin::SodiumAuthority>(),
                                 std::make_shared<wxlogin::HttpCodeExchanger>(xopt));

    wxlogin::RoutesLoginContext rctx;
    rctx.login = &login;
    rctx.client_ip = [](const httplib::Request& req) -> std::string {
        const std::string cf = req.get_header_value("CF-Connecting-IP");
        if (!cf.empty()) return cf;
        return req.remote_addr.empty() ? "?" : req.remote_addr;
    };
    rctx.audit_emit = [&audit](const std::string& event,
                               const std::string& outcome,
                               const std::function<void(std::map<std::string, std::string>&)>& fill) {
        wxlogin::AuditEvent ev;
        ev.event = event;
        ev.outcome = outcome;
        if (fill) fill(ev.f);
        // Successful auth happens on every request; keep it below the default level.
        const auto lv = (event == "auth.ok") ? wxlogin::AuditLog::Level::DEBUG
                      : (outcome == "ok")    ? wxlogin::AuditLog::Level::INFO
                                             : wxlogin::AuditLog::Level::SECURITY;
        audit.append(lv, ev);
    };

    httplib::Server srv;
    wxlogin::register_routes_login(srv, rctx);

    std::cerr << "wxlogin server listening on 0.0.0.0:" << LISTEN_PORT
              << " (auth_sig=" << (cfg->auth_sig ? "1" : "0") << ")" << std::endl;
    if (!srv.listen("0.0.0.0", LISTEN_PORT)) {
        std::cerr << "listen failed on port " << LISTEN_PORT << std::endl;
        return 3;
    }
    return 0;
}
