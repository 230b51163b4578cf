#pragma once

#include <string>

#include "httplib.h"
#include "wx_login.h"

namespace wxlogin {

inline constexpr const char* kStokenHeader = "X-WX-Stoken";
inline constexpr const char* kSigHeader = "X-WX-Sig";

// X-WX-Sig as a SigInput: present with the header value, or unavailable
// with the reason ("missing X-WX-Sig header", "empty X-WX-Sig header").
SigInput sig_from_request(const httplib::Request& req);

// URI bound into SG1 signatures: request target (path + query) as received.
std::string request_uri(const httplib::Request& req);

// Returns true if the request carries a valid session (and signature when
// the config requires one). On failure writes a uniform 401 JSON response and
// returns false; the specific cause goes to out_detail (for logs only).
bool require_login(const httplib::Request& req,
                   httplib::Response& res,
                   const WxLogin& login,
                   LoginInfo* out_info,
                   std::string* out_detail = nullptr);

} // namespace wxlogin
