#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace retry_http {
namespace util {

inline char toupper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 32) : c;
}

inline char tolower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : c;
}

inline std::string toupper(const std::string& str) {
    std::string s(str);
    for (char& c : s)
        c = toupper(c);
    return s;
}

inline std::string_view trim(std::string_view sv) {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
        sv.remove_prefix(1);
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
        sv.remove_suffix(1);
    return sv;
}

inline std::vector<std::string> split(std::string_view sv, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = sv.find(sep, start);
        parts.emplace_back(sv.substr(start, pos == std::string_view::npos ? std::string_view::npos : pos - start));
        if (pos == std::string_view::npos)
            break;
        start = pos + 1;
    }
    return parts;
}

/**
 * Case-insensitive ordering for header names.
 */
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](char l, char r) { return tolower(l) < tolower(r); });
    }
};

/**
 * Per-thread random engine, seeded once from random_device and the thread id.
 */
inline std::mt19937_64& random_engine() {
    thread_local std::mt19937_64 rg{
        [] {
            std::random_device rd;
            std::seed_seq seq{
                rd(), rd(), rd(), rd(),
                static_cast<unsigned>(
                    std::hash<std::thread::id>{}(std::this_thread::get_id()))
            };
            return std::mt19937_64(seq);
        }()
    };
    return rg;
}

/**
 * Uniform integer jitter in [lo, hi].
 */
inline int64_t jitter_generator(int64_t lo, int64_t hi) {
    if (hi < lo) std::swap(lo, hi);
    std::uniform_int_distribution<int64_t> dist(lo, hi);
    return dist(random_engine());
}

/**
 * application/x-www-form-urlencoded escaping: unreserved characters kept,
 * space becomes '+', everything else percent-encoded.
 */
inline std::string formEscape(std::string_view in) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

/**
 * Form values, key -> list of values. Keys are encoded in sorted order.
 */
using FormValues = std::map<std::string, std::vector<std::string>>;

inline std::string formEncode(const FormValues& values) {
    std::string out;
    for (const auto& [key, vals] : values) {
        const std::string k = formEscape(key);
        for (const auto& v : vals) {
            if (!out.empty())
                out.push_back('&');
            out += k;
            out.push_back('=');
            out += formEscape(v);
        }
    }
    return out;
}

} // namespace util

using util::FormValues;

} // namespace retry_http
