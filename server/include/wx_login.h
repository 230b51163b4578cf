#pragma once

#include <memory>
#include <string>
#include <utility>

#include "authority.h"
#include "code2session.h"
#include "config.h"

namespace wxlogin {

// Fixed, client-safe messages. Only status/code vary for login errors.
inline constexpr const char* kLoginFailMsg = "登录验证失败";
inline constexpr const char* kAuthFailMsg = "登录会话验证失败";

struct LoginOk {
    std::string openid;
    std::string stoken; // ST1:<appid>:<openid>:<sess_token>
    std::string skey;   // client signing key (standard base64)
};

// status: 401 or 500
// code:   appid-not-found | jscode2session-call-fail | jscode2session-resp-fail |
//         session-key-invalid-base64 | session-make-fail
// detail: diagnostics for logs; not a stable contract
struct LoginErr {
    int status = 500;
    std::string code;
    std::string message;
    std::string detail;
};

struct LoginResult {
    bool ok = false;
    LoginOk value;
    LoginErr error;
};

struct LoginInfoData {
    std::string appid;
    std::string openid;
    Secret secret;
    bool sig_authed = false;
};

// Immutable, shared by every handler that sees the request.
using LoginInfo = std::shared_ptr<const LoginInfoData>;

struct AuthResult {
    bool ok = false;
    LoginInfo info;     // set iff ok
    std::string detail; // first violated check; never sent to clients
};

/*
SigInput
--------
The X-WX-Sig value as seen by the caller: either the header text, or the
reason it could not be obtained. The reason is carried so that a required but
missing signature fails with it instead of being treated as "no signature".
*/
struct SigInput {
    bool present = false;
    std::string text; // header value when present, reason otherwise

    static SigInput of(std::string value) {
        SigInput s;
        s.present = true;
        s.text = std::move(value);
        return s;
    }

    static SigInput unavailable(std::string reason) {
        SigInput s;
        s.present = false;
        s.text = std::move(reason);
        return s;
    }
};

/*
WxLogin
=======

Login and per-request authentication for mini-program users.

  handle_login : code -> jscode2session -> Authority -> ST1 token
  authenticate : ST1 -> app lookup -> Authority -> [SG1 -> Authority] -> LoginInfo

Stateless: nothing is remembered between calls. The only shared state is the
read-only Config, so both operations may run concurrently on any thread.
authenticate() performs no I/O.
*/
class WxLogin {
public:
    WxLogin(std::shared_ptr<const Config> cfg,
            std::shared_ptr<const Authority> authority,
            std::shared_ptr<const CodeExchanger> exchanger);

    LoginResult handle_login(const std::string& appid, const std::string& code) const;

    AuthResult authenticate(const std::string& stoken,
                            const std::string& uri,
                            const SigInput& sig) const;

    const Config& config() const { return *cfg_; }

private:
    std::shared_ptr<const Config> cfg_;
    std::shared_ptr<const Authority> authority_;
    std::shared_ptr<const CodeExchanger> exchanger_;
};

} // namespace wxlogin
