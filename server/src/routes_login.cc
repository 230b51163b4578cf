// routes_login.cc
//
// HTTP surface for mini-program login.
//
// - /api/login is the only route that talks to the provider. Its error body is
//   the LoginErr shape (status/code/message/detail) so clients can branch on
//   `code` while `message` stays a fixed user-facing string.
// - /api/whoami is the reference protected route: it runs require_login()
//   and echoes the identity. Real handlers follow the same pattern.
// - Responses are no-store; they carry session credentials.

#include "routes_login.h"

#include "audit_fields.h"
#include "authz.h"
#include "wx_login.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

using nlohmann::json;

namespace wxlogin {

static void reply_json(httplib::Response& res, int status, const std::string& body) {
    res.status = status;
    res.set_header("Content-Type", "application/json; charset=utf-8");
    res.set_header("Cache-Control", "no-store");
    res.body = body;
}

static bool parse_json_body(const httplib::Request& req, json& out, std::string& err) {
    try {
        if (req.body.empty()) { err = "empty_body"; return false; }
        out = json::parse(req.body);
        if (!out.is_object()) { err = "json_must_be_object"; return false; }
        return true;
    } catch (const std::exception& e) {
        err = std::string("json_parse_error: ") + e.what();
        return false;
    }
}

void register_routes_login(httplib::Server& srv, const RoutesLoginContext& ctx) {
    if (!ctx.login) throw std::invalid_argument("register_routes_login: ctx.login is required");

    // Copy the context into the handlers; the server may outlive the caller's struct.
    const RoutesLoginContext c = ctx;

    auto ip_of = [c](const httplib::Request& req) -> std::string {
        if (c.client_ip) return c.client_ip(req);
        return req.remote_addr.empty() ? "?" : req.remote_addr;
    };

    srv.Post("/api/login", [c, ip_of](const httplib::Request& req, httplib::Response& res) {
        json body;
        std::string err;
        if (!parse_json_body(req, body, err)) {
            reply_json(res, 400, json({{"ok", false}, {"error", "bad_request"}, {"message", err}}).dump());
            return;
        }

        const auto str_or_empty = [&body](const char* key) -> std::string {
            const auto it = body.find(key);
            if (it == body.end() || !it->is_string()) return "";
            return it->get<std::string>();
        };
        const std::string appid = str_or_empty("appid");
        const std::string code = str_or_empty("code");
        if (appid.empty() || code.empty()) {
            reply_json(res, 400, json({{"ok", false}, {"error", "bad_request"},
                                       {"message", "appid and code are required"}}).dump());
            return;
        }

        const LoginResult lr = c.login->handle_login(appid, code);

        if (c.audit_emit) {
            c.audit_emit(lr.ok ? "login.ok" : "login.fail", lr.ok ? "ok" : "fail",
                         [&](std::map<std::string, std::string>& f) {
                f["appid"] = appid;
                f["ip"] = ip_of(req);
                f["ua"] = shorten(req.get_header_value("User-Agent"), 120);
                if (lr.ok) {
                    f["openid"] = shorten(lr.value.openid, 12);
                } else {
                    f["code"] = lr.error.code;
                    if (!lr.error.detail.empty()) f["detail"] = shorten(lr.error.detail, 180);
                }
            });
        }

        if (!lr.ok) {
            json out = {
                {"status", lr.error.status},
                {"code", lr.error.code},
                {"message", lr.error.message},
                {"detail", lr.error.detail},
            };
            reply_json(res, lr.error.status, out.dump());
            return;
        }

        json out = {
            {"openid", lr.value.openid},
            {"stoken", lr.value.stoken},
            {"skey", lr.value.skey},
        };
        reply_json(res, 200, out.dump());
    });

    srv.Get("/api/whoami", [c, ip_of](const httplib::Request& req, httplib::Response& res) {
        LoginInfo info;
        std::string detail;
        const bool ok = require_login(req, res, *c.login, &info, &detail);

        if (c.audit_emit) {
            c.audit_emit(ok ? "auth.ok" : "auth.fail", ok ? "ok" : "fail",
                         [&](std::map<std::string, std::string>& f) {
                f["path"] = req.path;
                f["ip"] = ip_of(req);
                if (ok) {
                    f["appid"] = info->appid;
                    f["openid"] = shorten(info->openid, 12);
                    f["sig_authed"] = info->sig_authed ? "1" : "0";
                } else {
                    f["reason"] = shorten(detail, 180);
                }
            });
        }
        if (!ok) return;

        json out = {
            {"ok", true},
            {"appid", info->appid},
            {"openid", info->openid},
            {"sig_authed", info->sig_authed},
        };
        reply_json(res, 200, out.dump());
    });
}

} // namespace wxlogin
