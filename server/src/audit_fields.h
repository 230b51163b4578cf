#pragma once
#include <string>

namespace wxlogin {

    // Audit and log lines carry identifiers only.
    //
    // OK to log:
    /// - appid
    /// - openid (shortened)
    /// - login error code / reason text
    /// - ip / user agent (shortened)
    ///
    /// NOT OK:
    /// - js_code (one-time, but still a credential until used)
    /// - stoken / skey
    /// - provider session_key, app secret
    /// - SG1 signature values

    inline std::string shorten(const std::string& s, size_t maxlen = 64) {
        if (s.size() <= maxlen) return s;
        return s.substr(0, maxlen) + "...";
    }

    // Keeps only the first 4 chars so a value can be correlated without being reusable.
    inline std::string redact(const std::string& s) {
        if (s.empty()) return "<empty>";
        if (s.size() <= 4) return "****";
        return s.substr(0, 4) + "****(" + std::to_string(s.size()) + ")";
    }

} // namespace wxlogin
