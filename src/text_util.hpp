#pragma once
#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

namespace vadseg {

inline void trim_inplace(std::string& s) {
    auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

// Whole-string conversions; trailing garbage counts as unparseable.
inline std::optional<int> as_int(const std::string& s) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

inline std::optional<long long> as_int64(const std::string& s) {
    try {
        size_t used = 0;
        long long v = std::stoll(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

inline std::optional<float> as_float(const std::string& s) {
    try {
        size_t used = 0;
        float v = std::stof(s, &used);
        if (used != s.size()) return std::nullopt;
        return v;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

} // namespace vadseg
