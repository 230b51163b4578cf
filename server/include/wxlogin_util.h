#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace wxlogin {

    long now_epoch();
    std::int64_t now_epoch_ms();
    std::string now_iso_utc();
    std::string lower_ascii(std::string s);

    // Standard base64 WITH padding (matches what WeChat sends for session_key)
    std::string b64_std(const unsigned char* data, size_t len);

    // URL-safe base64 without padding (token components, signatures)
    std::string b64url_enc(const unsigned char* data, size_t len);

    // Strict decoders: exactly one variant, no whitespace. Return false on any error.
    bool b64_std_dec(const std::string& s, std::vector<unsigned char>& out);
    bool b64url_dec(const std::string& s, std::vector<unsigned char>& out);

    // Split on a single character; keeps empty fields.
    std::vector<std::string> split_char(const std::string& s, char sep);

} // namespace wxlogin
