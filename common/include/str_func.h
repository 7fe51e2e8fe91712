#pragma once
#ifndef _SPLIT_STRING_
#define _SPLIT_STRING_
#include <vector>
#include <string>
#include <string_view>
#include <ranges>
#include <charconv>
namespace sfunc {
inline auto split(std::string_view str, std::string_view delim) {
    auto v = str | std::views::split(delim) | std::views::transform([](auto&& unit) {
        return std::string_view(unit.begin(), unit.end());
    });
    return std::vector<std::string_view>{v.begin(), v.end()};
}

inline std::string_view trim(std::string_view str) {
    while (!str.empty() && (str.front() == ' ' || str.front() == '\t')) {
        str.remove_prefix(1);
    }
    while (!str.empty() && (str.back() == ' ' || str.back() == '\t' || str.back() == '\r')) {
        str.remove_suffix(1);
    }
    return str;
}

inline bool toInt(std::string_view sv, int& v) {
    sv = trim(sv);
    if (sv.empty()) return false;
    auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
    return ec == std::errc{} && ptr == sv.data() + sv.size();
}

// "2024-08-11"
inline bool parseDate(std::string_view sv, int& y, int& m, int& d) {
    auto&& us = split(trim(sv), "-");
    if (us.size() != 3) return false;
    return toInt(us[0], y) && toInt(us[1], m) && toInt(us[2], d);
}

// "16:54" -> 16.9
inline bool parseClock(std::string_view sv, double& hour) {
    auto&& us = split(trim(sv), ":");
    if (us.size() != 2) return false;
    auto h{0};
    auto m{0};
    if (!toInt(us[0], h) || !toInt(us[1], m)) return false;
    if (h < 0 || h > 23 || m < 0 || m > 59) return false;
    hour = h + m / 60.0;
    return true;
}
}
#endif
