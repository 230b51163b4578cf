#pragma once
#include <httplib.h>

#include <functional>
#include <map>
#include <string>

namespace wxlogin {

class WxLogin;

// Everything the login routes need from main.cpp, injected so the routes can
// be exercised against a test server.
struct RoutesLoginContext {
    const WxLogin* login = nullptr; // required, owned by caller

    std::function<std::string(const httplib::Request&)> client_ip;

    // audit (optional)
    std::function<void(const std::string& event,
                       const std::string& outcome,
                       const std::function<void(std::map<std::string, std::string>&)>& fill_fields)> audit_emit;
};

//   POST /api/login   {"appid","code"} -> {"openid","stoken","skey"} | LoginErr JSON
//   GET  /api/whoami  (X-WX-Stoken [+ X-WX-Sig]) -> {"appid","openid","sig_authed"}
void register_routes_login(httplib::Server& srv, const RoutesLoginContext& ctx);

} // namespace wxlogin
