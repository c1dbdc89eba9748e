#ifndef sqlgate_CORE_UTILS_HPP
#define sqlgate_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace sqlgate {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Monotonic milliseconds, for measuring durations only
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace (space, tab, CR, LF, VT, FF) from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// ASCII case conversion
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// Single-line preview for log output: newlines collapsed, truncated with "..."
std::string log_preview(const std::string& s, size_t max_len = 80);

// ============ Encoding utilities ============

// Standard base64 (RFC 4648, padded)
std::string base64_encode(const std::vector<uint8_t>& data);

// ============ Hashing utilities ============

// Lowercase hex SHA-256 of the input
std::string sha256_hex(const std::string& data);

} // namespace sqlgate

#endif // sqlgate_CORE_UTILS_HPP
