#include "utils.hpp"
#include <fmt/format.h>
#include <openssl/rand.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <random>
#include <stdexcept>
#include <vector>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

std::optional<int64_t> safe_stoll(const std::string& s) {
    if (s.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return static_cast<int64_t>(v);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string random_hex(size_t n_bytes) {
    // Transfer ids are bearer handles: draw from the OpenSSL CSPRNG
    std::vector<unsigned char> bytes(n_bytes);
    if (n_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(n_bytes)) != 1) {
        std::random_device rd;
        for (auto& b : bytes) b = static_cast<unsigned char>(rd() & 0xFF);
    }
    std::string out;
    out.reserve(n_bytes * 2);
    for (unsigned char b : bytes) out += fmt::format("{:02x}", b);
    return out;
}

std::string random_uuid() {
    std::string hex = random_hex(16);
    hex[12] = '4';
    static const char variant[] = "89ab";
    hex[16] = variant[std::stoi(hex.substr(16, 1), nullptr, 16) & 0x3];
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

// Length of the UTF-8 sequence starting at `lead`; 1 for invalid lead bytes.
static size_t utf8_seq_len(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x6) return 2;
    if ((lead >> 4) == 0xE) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

static size_t utf8_step(const std::string& s, size_t i) {
    size_t len = utf8_seq_len(static_cast<unsigned char>(s[i]));
    if (i + len > s.size()) return 1;
    for (size_t k = 1; k < len; ++k) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

size_t utf8_length(const std::string& s) {
    size_t count = 0;
    for (size_t i = 0; i < s.size(); i += utf8_step(s, i)) ++count;
    return count;
}

size_t utf8_prefix_bytes(const std::string& s, size_t n) {
    size_t i = 0;
    for (size_t count = 0; count < n && i < s.size(); ++count) {
        i += utf8_step(s, i);
    }
    return i;
}

std::string format_bytes(uint64_t bytes) {
    if (bytes < 1024) return fmt::format("{} B", bytes);
    double v = static_cast<double>(bytes) / 1024.0;
    if (v < 1024.0) return fmt::format("{:.1f} KB", v);
    v /= 1024.0;
    if (v < 1024.0) return fmt::format("{:.1f} MB", v);
    return fmt::format("{:.1f} GB", v / 1024.0);
}
