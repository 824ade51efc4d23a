#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Whole-string 64-bit parse; nullopt on trailing garbage or overflow.
std::optional<int64_t> safe_stoll(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// Wrap in single quotes for a POSIX shell ('it'\''s' style escaping).
std::string shell_quote(const std::string& s);

// Lowercase hex of `n_bytes` bytes from the OpenSSL CSPRNG.
std::string random_hex(size_t n_bytes);

// Random RFC 4122 v4 identifier (8-4-4-4-12 hex).
std::string random_uuid();

// Number of UTF-8 code points; invalid bytes count as one each.
size_t utf8_length(const std::string& s);

// Byte offset just past the first `n` code points.
size_t utf8_prefix_bytes(const std::string& s, size_t n);

// "1.5 MB" style size for reports.
std::string format_bytes(uint64_t bytes);
