#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ───────────────────────────────────────────────────────────────
// Character classes (ASCII only; source code is treated as bytes)
// ───────────────────────────────────────────────────────────────

inline bool is_space_ascii(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' ||
           c == '\r' || c == '\v' || c == '\f';
}

inline bool is_digit_ascii(unsigned char c) {
    return c >= '0' && c <= '9';
}

inline bool is_ident_start(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

// [A-Za-z0-9_], the \w class of a regex word boundary
inline bool is_word_char(unsigned char c) {
    return is_ident_start(c) || is_digit_ascii(c);
}

// ───────────────────────────────────────────────────────────────
// trim / collapse helpers
// ───────────────────────────────────────────────────────────────

inline std::string_view trim_view(std::string_view s) {
    std::size_t start = 0;
    std::size_t end   = s.size();

    while (start < end && is_space_ascii((unsigned char)s[start])) ++start;
    while (end > start && is_space_ascii((unsigned char)s[end - 1])) --end;

    return s.substr(start, end - start);
}

inline void trim_spaces(std::string& s) {
    const std::string_view v = trim_view(s);
    if (v.size() == s.size()) return;
    if (v.empty()) {
        s.clear();
        return;
    }
    s = std::string(v); // one copy
}

// any whitespace run -> single ' '
inline std::string collapse_spaces(std::string_view in) {
    std::string out;
    out.reserve(in.size());

    bool prev_space = false;
    for (unsigned char c : in) {
        if (is_space_ascii(c)) {
            if (!prev_space) {
                out.push_back(' ');
                prev_space = true;
            }
        } else {
            out.push_back((char)c);
            prev_space = false;
        }
    }
    return out;
}

// "a\nb\n" -> {"a", "b", ""}; every '\n' ends a line
inline std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    lines.reserve(64);

    std::size_t start = 0;
    for (;;) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// ───────────────────────────────────────────────────────────────
// UTF-8 decoding
// ───────────────────────────────────────────────────────────────

// Decodes one code point at data[i] and advances i. An invalid or truncated
// sequence consumes one byte, yields U+0020 and returns false.
inline bool decode_utf8_cp(
    const unsigned char* data,
    std::size_t n,
    std::size_t& i,
    std::uint32_t& cp
) {
    if (i >= n) {
        return false;
    }

    unsigned char c = data[i];

    // 1-byte (ASCII)
    if (c < 0x80) {
        cp = c;
        ++i;
        return true;
    }

    // 2-byte
    if ((c & 0xE0) == 0xC0 && i + 1 < n) {
        unsigned char c1 = data[i + 1];
        if ((c1 & 0xC0) != 0x80) {
            cp = 0x20;
            ++i;
            return false;
        }
        cp = ((std::uint32_t)(c & 0x1F) << 6) |
             (std::uint32_t)(c1 & 0x3F);
        i += 2;
        return true;
    }

    // 3-byte
    if ((c & 0xF0) == 0xE0 && i + 2 < n) {
        unsigned char c1 = data[i + 1];
        unsigned char c2 = data[i + 2];
        if (((c1 & 0xC0) != 0x80) || ((c2 & 0xC0) != 0x80)) {
            cp = 0x20;
            ++i;
            return false;
        }
        cp = ((std::uint32_t)(c  & 0x0F) << 12) |
             ((std::uint32_t)(c1 & 0x3F) << 6)  |
             (std::uint32_t)(c2 & 0x3F);
        i += 3;
        return true;
    }

    // 4-byte
    if ((c & 0xF8) == 0xF0 && i + 3 < n) {
        unsigned char c1 = data[i + 1];
        unsigned char c2 = data[i + 2];
        unsigned char c3 = data[i + 3];
        if (((c1 & 0xC0) != 0x80) ||
            ((c2 & 0xC0) != 0x80) ||
            ((c3 & 0xC0) != 0x80)) {
            cp = 0x20;
            ++i;
            return false;
        }
        cp = ((std::uint32_t)(c  & 0x07) << 18) |
             ((std::uint32_t)(c1 & 0x3F) << 12) |
             ((std::uint32_t)(c2 & 0x3F) << 6)  |
             (std::uint32_t)(c3 & 0x3F);
        i += 4;
        return true;
    }

    // invalid leading byte
    cp = 0x20;
    ++i;
    return false;
}

// ───────────────────────────────────────────────────────────────
// 32-bit multiply-add digest (h = h*31 + cp), not cryptographic
// ───────────────────────────────────────────────────────────────

using Digest = std::int32_t;

// Accumulates code points, not bytes; invalid UTF-8 counts as U+0020.
inline Digest hash_fingerprint(std::string_view s) {
    const unsigned char* data = (const unsigned char*)s.data();
    const std::size_t n = s.size();

    // unsigned accumulator: wraparound mod 2^32 is well defined
    std::uint32_t h = 0;
    std::size_t i = 0;
    while (i < n) {
        std::uint32_t cp = 0;
        if (data[i] < 0x80) {
            // ASCII fast-path
            cp = data[i];
            ++i;
        } else {
            decode_utf8_cp(data, n, i, cp);
        }
        h = (h << 5) - h + cp;
    }
    return (Digest)h;
}

// signed radix-16: -0x1f renders as "-1f"
inline std::string format_digest(Digest d) {
    static const char HEX[] = "0123456789abcdef";

    const bool neg = d < 0;
    std::uint32_t mag = neg ? (std::uint32_t)0 - (std::uint32_t)d : (std::uint32_t)d;

    char buf[12];
    int p = (int)sizeof(buf);
    do {
        buf[--p] = HEX[mag & 0xF];
        mag >>= 4;
    } while (mag != 0);
    if (neg) buf[--p] = '-';

    return std::string(buf + p, buf + sizeof(buf));
}
