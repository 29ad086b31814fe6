#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Code point helpers for UTF-8 text. Malformed sequences are counted one byte
// per code point so nothing is ever dropped.
namespace utf8 {

inline size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead >> 5) == 0x06) return 2;
    if ((lead >> 4) == 0x0E) return 3;
    if ((lead >> 3) == 0x1E) return 4;
    return 1;
}

// Length of the sequence starting at pos, clamped to what is actually there.
inline size_t next_length(std::string_view s, size_t pos) {
    size_t len = sequence_length(static_cast<unsigned char>(s[pos]));
    if (pos + len > s.size()) return 1;
    for (size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(s[pos + i]) & 0xC0) != 0x80) return 1;
    }
    return len;
}

inline size_t length(std::string_view s) {
    size_t count = 0;
    for (size_t pos = 0; pos < s.size(); pos += next_length(s, pos)) {
        ++count;
    }
    return count;
}

// Splits into consecutive pieces of at most max_chars code points each.
// Empty input yields no pieces.
inline std::vector<std::string> split(std::string_view s, size_t max_chars) {
    std::vector<std::string> parts;
    if (max_chars == 0) return parts;

    size_t start = 0;
    size_t pos = 0;
    size_t count = 0;
    while (pos < s.size()) {
        pos += next_length(s, pos);
        if (++count == max_chars) {
            parts.emplace_back(s.substr(start, pos - start));
            start = pos;
            count = 0;
        }
    }
    if (start < s.size()) {
        parts.emplace_back(s.substr(start));
    }
    return parts;
}

// Byte offset for every UTF-16 code unit index, plus one trailing entry equal
// to s.size(). Both units of a surrogate pair map to the same byte offset.
inline std::vector<size_t> utf16_to_byte_offsets(std::string_view s) {
    std::vector<size_t> offsets;
    offsets.reserve(s.size() + 1);
    for (size_t pos = 0; pos < s.size();) {
        size_t len = next_length(s, pos);
        offsets.push_back(pos);
        if (len == 4) offsets.push_back(pos);
        pos += len;
    }
    offsets.push_back(s.size());
    return offsets;
}

} // namespace utf8
