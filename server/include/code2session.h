#pragma once

#include <string>

namespace wxlogin {

inline constexpr const char* kCode2SessionUrl = "https://api.weixin.qq.com/sns/jscode2session";

enum class ExchangeRc : int {
    OK = 0,
    CALL_FAIL = 10, // no usable HTTP response (connect, TLS, timeout, non-2xx)
    RESP_FAIL = 20, // response arrived but is not a session (errcode, bad JSON, missing fields)
};

struct ExchangeResult {
    ExchangeRc rc = ExchangeRc::CALL_FAIL;

    std::string openid;
    std::string session_key; // base64 text as sent by the provider
    std::string unionid;     // optional, empty when absent

    std::string detail; // short, no secrets

    bool ok() const { return rc == ExchangeRc::OK; }
};

// Exchanges a one-time login code for (openid, session_key).
// Implementations hold no per-call state and may be shared across threads.
class CodeExchanger {
public:
    virtual ~CodeExchanger() = default;

    virtual ExchangeResult exchange(const std::string& appid,
                                    const std::string& secret,
                                    const std::string& code) const = 0;
};

struct HttpExchangerOptions {
    // Full endpoint URL: scheme://host[:port]/path
    std::string url = kCode2SessionUrl;

    int connect_timeout_sec = 5;
    int read_timeout_sec = 10;
};

// GET <url>?appid=..&secret=..&js_code=..&grant_type=authorization_code
// One httplib::Client per call.
class HttpCodeExchanger : public CodeExchanger {
public:
    explicit HttpCodeExchanger(HttpExchangerOptions opt = HttpExchangerOptions{});

    ExchangeResult exchange(const std::string& appid,
                            const std::string& secret,
                            const std::string& code) const override;

private:
    HttpExchangerOptions opt_;
    std::string scheme_host_port_;
    std::string path_;
};

// Parses a jscode2session response body. Exposed for tests.
ExchangeResult parse_code2session_body(const std::string& body);

} // namespace wxlogin
