#pragma once
#include <string>

namespace wxlogin {

/*
Wire tokens held by the client
==============================

  session token   := "ST1" ":" appid ":" openid ":" sess_token
  signature token := "SG1" ":" ts_ms ":" nonce ":" signature

Exactly four non-empty fields separated by ':'. No escaping is done, so no
component may contain ':' (the encoders refuse such input).
*/

inline constexpr char kTokenSep = ':';
inline constexpr const char* kSessionTag = "ST1";
inline constexpr const char* kSigTag = "SG1";

enum class TokenRc : int {
    OK = 0,
    BAD_FORMAT = 10,  // wrong field count or empty field
    BAD_TAG = 11,     // first field is not the expected tag
    BAD_COMPONENT = 20, // encode: empty component or contains ':'
};

struct SessionTokenParts {
    std::string appid;
    std::string openid;
    std::string token;
};

struct SigTokenParts {
    std::string ts_ms;
    std::string nonce;
    std::string sig;
};

struct TokenDecodeResult {
    TokenRc rc = TokenRc::BAD_FORMAT;
    std::string detail; // "bad stoken format", "bad sig tag:XYZ", ...

    bool ok() const { return rc == TokenRc::OK; }
};

// Encoding returns false (and leaves out untouched) if a component is empty or
// contains the separator.
bool encode_session_token(const std::string& appid,
                          const std::string& openid,
                          const std::string& token,
                          std::string& out);

bool encode_sig_token(const std::string& ts_ms,
                      const std::string& nonce,
                      const std::string& sig,
                      std::string& out);

TokenDecodeResult decode_session_token(const std::string& s, SessionTokenParts& out);
TokenDecodeResult decode_sig_token(const std::string& s, SigTokenParts& out);

} // namespace wxlogin
