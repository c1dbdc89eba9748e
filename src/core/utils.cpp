#include <sqlgate/core/utils.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace sqlgate {

static const char* const WHITESPACE = " \t\n\r\v\f";

// ============ Time utilities ============

int64_t monotonic_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

// ============ String utilities ============

std::string trim(const std::string& s) {
    return rtrim(ltrim(s));
}

std::string ltrim(const std::string& s) {
    size_t start = s.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string rtrim(const std::string& s) {
    size_t end = s.find_last_not_of(WHITESPACE);
    if (end == std::string::npos) return "";
    return s.substr(0, end + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string to_upper(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return result;
}

std::string truncate_safe(const std::string& s, size_t max_len) {
    if (s.size() <= max_len) return s;

    size_t len = max_len;
    while (len > 0 && (static_cast<unsigned char>(s[len]) & 0xC0) == 0x80) {
        --len;  // Back up if in the middle of a multi-byte sequence
    }
    return s.substr(0, len);
}

std::string log_preview(const std::string& s, size_t max_len) {
    std::string flat;
    flat.reserve(std::min(s.size(), max_len + 1));
    bool last_was_space = false;
    for (size_t i = 0; i < s.size() && flat.size() <= max_len; ++i) {
        char c = s[i];
        if (c == '\n' || c == '\r' || c == '\t') {
            c = ' ';
        }
        if (c == ' ' && last_was_space) continue;
        last_was_space = (c == ' ');
        flat += c;
    }
    if (flat.size() > max_len) {
        return truncate_safe(flat, max_len) + "...";
    }
    return flat;
}

// ============ Encoding utilities ============

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) return "";

    // EVP_EncodeBlock writes 4 output bytes per 3 input bytes plus a NUL
    std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

// ============ Hashing utilities ============

std::string sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    char hex[SHA256_DIGEST_LENGTH * 2 + 1];
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        snprintf(hex + i * 2, 3, "%02x", digest[i]);
    }
    return std::string(hex, SHA256_DIGEST_LENGTH * 2);
}

} // namespace sqlgate
