#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <random>
#include <mutex>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string generate_uuid() {
    static std::mutex rng_mutex;
    static std::mt19937_64 rng(std::random_device{}());

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        hi = rng();
        lo = rng();
    }
    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint32_t>((hi >> 16) & 0xFFFF),
                       static_cast<uint32_t>(hi & 0xFFFF),
                       static_cast<uint32_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

std::string sanitize_utf8(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    const auto* p = reinterpret_cast<const unsigned char*>(s.data());
    size_t n = s.size();
    size_t i = 0;
    while (i < n) {
        unsigned char c = p[i];
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0 && c >= 0xC2) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0 && c <= 0xF4) len = 4;

        if (len == 0 || i + len > n) { ++i; continue; }

        bool ok = true;
        for (size_t k = 1; k < len; ++k) {
            if ((p[i + k] & 0xC0) != 0x80) { ok = false; break; }
        }
        // Overlongs and surrogates
        if (ok && len == 3) {
            if (c == 0xE0 && p[i + 1] < 0xA0) ok = false;
            if (c == 0xED && p[i + 1] >= 0xA0) ok = false;
        }
        if (ok && len == 4) {
            if (c == 0xF0 && p[i + 1] < 0x90) ok = false;
            if (c == 0xF4 && p[i + 1] >= 0x90) ok = false;
        }
        if (!ok) { ++i; continue; }

        out.append(s, i, len);
        i += len;
    }
    return out;
}
