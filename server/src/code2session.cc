#include "code2session.h"

/*
 * code2session.cc
 *
 * Client for the WeChat jscode2session endpoint.
 *
 * Failure classes:
 * - CALL_FAIL: we never got a usable HTTP answer. Retrying may help.
 * - RESP_FAIL: the provider answered but not with a session for this code
 *   (expired/used code -> errcode 40029/40163, rate limit -> 45011, or a body
 *   we cannot read). Retrying the same code will not help.
 *
 * The secret travels only in the query string of the outbound call; it is
 * never copied into ExchangeResult::detail.
 */

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

using nlohmann::json;

namespace wxlogin {

static ExchangeResult fail(ExchangeRc rc, const std::string& detail) {
    ExchangeResult r;
    r.rc = rc;
    r.detail = detail;
    return r;
}

// "https://api.weixin.qq.com/sns/jscode2session" -> ("https://api.weixin.qq.com", "/sns/jscode2session")
static void split_url(const std::string& url, std::string& scheme_host_port, std::string& path) {
    const auto scheme_end = url.find("://");
    const size_t host_start = (scheme_end == std::string::npos) ? 0 : scheme_end + 3;
    const auto slash = url.find('/', host_start);
    if (slash == std::string::npos) {
        scheme_host_port = url;
        path = "/";
        return;
    }
    scheme_host_port = url.substr(0, slash);
    path = url.substr(slash);
}

HttpCodeExchanger::HttpCodeExchanger(HttpExchangerOptions opt)
    : opt_(std::move(opt)) {
    split_url(opt_.url, scheme_host_port_, path_);
}

ExchangeResult parse_code2session_body(const std::string& body) {
    json j;
    try {
        j = json::parse(body);
    } catch (const std::exception& e) {
        return fail(ExchangeRc::RESP_FAIL, std::string("json parse failed: ") + e.what());
    }

    if (!j.is_object()) return fail(ExchangeRc::RESP_FAIL, "response must be object");

    // Error envelope: {"errcode":40029,"errmsg":"invalid code, rid: ..."}
    if (j.contains("errcode") && j["errcode"].is_number_integer()) {
        const long errcode = j["errcode"].get<long>();
        if (errcode != 0) {
            return fail(ExchangeRc::RESP_FAIL,
                        "errcode=" + std::to_string(errcode) + " errmsg=" + j.value("errmsg", ""));
        }
    }

    for (auto k : {"session_key", "openid"}) {
        if (!j.contains(k) || !j[k].is_string()) {
            return fail(ExchangeRc::RESP_FAIL, std::string("missing field: ") + k);
        }
    }

    ExchangeResult r;
    r.rc = ExchangeRc::OK;
    r.session_key = j["session_key"].get<std::string>();
    r.openid = j["openid"].get<std::string>();
    if (j.contains("unionid") && j["unionid"].is_string()) {
        r.unionid = j["unionid"].get<std::string>();
    }
    return r;
}

ExchangeResult HttpCodeExchanger::exchange(const std::string& appid,
                                           const std::string& secret,
                                           const std::string& code) const {
    httplib::Client cli(scheme_host_port_);
    if (!cli.is_valid()) {
        return fail(ExchangeRc::CALL_FAIL, "invalid endpoint: " + scheme_host_port_);
    }
    cli.set_connection_timeout(opt_.connect_timeout_sec, 0);
    cli.set_read_timeout(opt_.read_timeout_sec, 0);

    httplib::Params params{
        {"appid", appid},
        {"secret", secret},
        {"js_code", code},
        {"grant_type", "authorization_code"},
    };

    auto res = cli.Get(path_, params, httplib::Headers{});
    if (!res) {
        return fail(ExchangeRc::CALL_FAIL, "http error: " + httplib::to_string(res.error()));
    }
    if (res->status < 200 || res->status >= 300) {
        return fail(ExchangeRc::CALL_FAIL, "http status " + std::to_string(res->status));
    }

    ExchangeResult r = parse_code2session_body(res->body);
    if (!r.ok()) {
        std::cerr << "[code2session] appid=" << appid << " " << r.detail << std::endl;
    }
    return r;
}

} // namespace wxlogin
