#include "authz.h"

#include <nlohmann/json.hpp>

#include <utility>

/*
Request authentication guard
============================

Every protected handler starts with require_login(). The response it writes on
failure is the same whatever check failed (bad token shape, unknown appid,
forged token, stale or wrong signature): the caller learns "not logged in" and
nothing about which part of its credential was wrong. The precise cause is
returned through out_detail for the audit log.
*/

namespace wxlogin {

using nlohmann::json;

static void reply_unauthorized(httplib::Response& res) {
    json out = {
        {"ok", false},
        {"error", "not_authorized"},
        {"message", kAuthFailMsg},
    };
    res.status = 401;
    res.set_header("Content-Type", "application/json; charset=utf-8");
    res.set_header("Cache-Control", "no-store");
    res.body = out.dump();
}

SigInput sig_from_request(const httplib::Request& req) {
    if (!req.has_header(kSigHeader)) {
        return SigInput::unavailable(std::string("missing ") + kSigHeader + " header");
    }
    std::string v = req.get_header_value(kSigHeader);
    if (v.empty()) {
        return SigInput::unavailable(std::string("empty ") + kSigHeader + " header");
    }
    return SigInput::of(std::move(v));
}

std::string request_uri(const httplib::Request& req) {
    return req.target.empty() ? req.path : req.target;
}

bool require_login(const httplib::Request& req,
                   httplib::Response& res,
                   const WxLogin& login,
                   LoginInfo* out_info,
                   std::string* out_detail) {
    const std::string stoken = req.get_header_value(kStokenHeader);
    if (stoken.empty()) {
        if (out_detail) *out_detail = std::string("missing ") + kStokenHeader + " header";
        reply_unauthorized(res);
        return false;
    }

    AuthResult ar = login.authenticate(stoken, request_uri(req), sig_from_request(req));
    if (!ar.ok) {
        if (out_detail) *out_detail = ar.detail;
        reply_unauthorized(res);
        return false;
    }

    if (out_info) *out_info = std::move(ar.info);
    return true;
}

} // namespace wxlogin
