#include "wxlogin_util.h"

#include <chrono>
#include <cctype>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sodium.h>

namespace wxlogin {

long now_epoch() {
    return (long)std::time(nullptr);
}

std::int64_t now_epoch_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string now_iso_utc() {
    using namespace std::chrono;

    auto now = system_clock::now();
    auto t = system_clock::to_time_t(now);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << ms.count()
        << 'Z';

    return oss.str();
}

std::string lower_ascii(std::string s) {
    for (char& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

static std::string b64_enc_variant(const unsigned char* data, size_t len, int variant) {
    const size_t outLen = sodium_base64_encoded_len(len, variant);
    std::string out(outLen, '\0');
    sodium_bin2base64(out.data(), out.size(), data, len, variant);

    // libsodium writes a trailing NUL; shrink to the C-string length.
    out.resize(std::strlen(out.c_str()));
    return out;
}

static bool b64_dec_variant(const std::string& s, std::vector<unsigned char>& out, int variant) {
    // Decoded length is <= encoded length.
    out.resize(s.size());

    size_t out_len = 0;
    const char* b64_end = nullptr;
    if (sodium_base642bin(out.data(), out.size(),
                          s.c_str(), s.size(),
                          /*ignore=*/nullptr,
                          &out_len,
                          &b64_end,
                          variant) != 0) {
        out.clear();
        return false;
    }

    // Reject trailing garbage after the last valid base64 character.
    if (b64_end != s.c_str() + s.size()) {
        out.clear();
        return false;
    }

    out.resize(out_len);
    return true;
}

std::string b64_std(const unsigned char* data, size_t len) {
    return b64_enc_variant(data, len, sodium_base64_VARIANT_ORIGINAL);
}

std::string b64url_enc(const unsigned char* data, size_t len) {
    return b64_enc_variant(data, len, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

bool b64_std_dec(const std::string& s, std::vector<unsigned char>& out) {
    return b64_dec_variant(s, out, sodium_base64_VARIANT_ORIGINAL);
}

bool b64url_dec(const std::string& s, std::vector<unsigned char>& out) {
    return b64_dec_variant(s, out, sodium_base64_VARIANT_URLSAFE_NO_PADDING);
}

std::vector<std::string> split_char(const std::string& s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        const size_t pos = s.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

} // namespace wxlogin
