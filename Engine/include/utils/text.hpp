#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Repealer {

/**
 * @brief UTF-8 to UTF-32 conversion. Invalid start bytes are skipped.
 */
inline std::u32string utf8_to_utf32(std::string_view s) {
    std::u32string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        char32_t cp = 0;
        size_t len = 0;

        if (c < 0x80) { cp = c; len = 1; }
        else if ((c >> 5) == 0x6) { cp = c & 0x1F; len = 2; }
        else if ((c >> 4) == 0xE) { cp = c & 0x0F; len = 3; }
        else if ((c >> 3) == 0x1E) { cp = c & 0x07; len = 4; }
        else { ++i; continue; }

        for (size_t j = 1; j < len; ++j) {
            if (i + j >= s.size()) { len = j; break; }
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) { len = j; break; }
            cp = (cp << 6) | (cc & 0x3F);
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

inline bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    return std::string(s.substr(b, e - b));
}

/**
 * @brief Collapse every run of whitespace (newlines included) into one space and trim.
 */
inline std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char c : s) {
        if (is_space(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

/**
 * @brief Cut to at most max_bytes without splitting a UTF-8 sequence.
 */
inline std::string utf8_truncate(std::string_view s, size_t max_bytes) {
    if (s.size() <= max_bytes) return std::string(s);
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<uint8_t>(s[cut]) & 0xC0) == 0x80) --cut;
    return std::string(s.substr(0, cut));
}

inline std::vector<std::string> split_words(std::string_view s) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && is_space(s[i])) ++i;
        size_t start = i;
        while (i < s.size() && !is_space(s[i])) ++i;
        if (i > start) words.emplace_back(s.substr(start, i - start));
    }
    return words;
}

inline bool contains_ci(std::string_view haystack_lower, std::string_view needle_lower) {
    return !needle_lower.empty() && haystack_lower.find(needle_lower) != std::string_view::npos;
}

/**
 * @brief Whole-word contains for already lower-cased text. A plural "s" after the
 * needle still counts, so "issues" matches "issue" but "tissue" and "defective" do not.
 */
inline bool contains_word_ci(std::string_view haystack_lower, std::string_view needle_lower) {
    if (needle_lower.empty()) return false;
    auto is_word = [](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; };
    for (size_t pos = haystack_lower.find(needle_lower); pos != std::string_view::npos;
         pos = haystack_lower.find(needle_lower, pos + 1)) {
        if (pos > 0 && is_word(haystack_lower[pos - 1])) continue;
        size_t end = pos + needle_lower.size();
        if (end < haystack_lower.size() && haystack_lower[end] == 's') ++end;
        if (end < haystack_lower.size() && is_word(haystack_lower[end])) continue;
        return true;
    }
    return false;
}

} // namespace Repealer
