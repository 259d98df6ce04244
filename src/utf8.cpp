#include "utf8.hpp"

namespace hilex {
namespace utf8 {

namespace {

bool is_cont(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

// 0 when the sequence at pos is ill-formed
size_t valid_length(std::string_view s, size_t pos) {
    const unsigned char b0 = static_cast<unsigned char>(s[pos]);
    const size_t left = s.size() - pos;

    if (b0 < 0x80) return 1;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        if (left < 2 || !is_cont(static_cast<unsigned char>(s[pos + 1]))) return 0;
        return 2;
    }

    if (b0 >= 0xE0 && b0 <= 0xEF) {
        if (left < 3) return 0;
        const unsigned char b1 = static_cast<unsigned char>(s[pos + 1]);
        const unsigned char b2 = static_cast<unsigned char>(s[pos + 2]);
        if (!is_cont(b1) || !is_cont(b2)) return 0;
        if (b0 == 0xE0 && b1 < 0xA0) return 0;   // overlong
        if (b0 == 0xED && b1 >= 0xA0) return 0;  // surrogates
        return 3;
    }

    if (b0 >= 0xF0 && b0 <= 0xF4) {
        if (left < 4) return 0;
        const unsigned char b1 = static_cast<unsigned char>(s[pos + 1]);
        const unsigned char b2 = static_cast<unsigned char>(s[pos + 2]);
        const unsigned char b3 = static_cast<unsigned char>(s[pos + 3]);
        if (!is_cont(b1) || !is_cont(b2) || !is_cont(b3)) return 0;
        if (b0 == 0xF0 && b1 < 0x90) return 0;
        if (b0 == 0xF4 && b1 > 0x8F) return 0;
        return 4;
    }

    return 0;
}

const char kReplacement[] = "\xEF\xBF\xBD";

}  // namespace

size_t sequence_length(std::string_view s, size_t pos) {
    if (pos >= s.size()) return 0;
    size_t n = valid_length(s, pos);
    return n == 0 ? 1 : n;
}

bool validate(std::string_view s, size_t& bad_off) {
    size_t i = 0;
    while (i < s.size()) {
        size_t n = valid_length(s, i);
        if (n == 0) {
            bad_off = i;
            return false;
        }
        i += n;
    }
    return true;
}

size_t sanitize(std::string& s) {
    size_t bad = 0;
    if (validate(s, bad)) return 0;

    std::string out;
    out.reserve(s.size() + 8);
    size_t replaced = 0;
    size_t i = 0;
    while (i < s.size()) {
        size_t n = valid_length(s, i);
        if (n == 0) {
            out += kReplacement;
            ++replaced;
            ++i;
            continue;
        }
        out.append(s, i, n);
        i += n;
    }
    s.swap(out);
    return replaced;
}

std::string from_latin1(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (char c : bytes) {
        append_codepoint(out, static_cast<unsigned char>(c));
    }
    return out;
}

size_t sanitize_ascii(std::string& s) {
    size_t replaced = 0;
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (static_cast<unsigned char>(c) < 0x80) {
            out.push_back(c);
        } else {
            out += kReplacement;
            ++replaced;
        }
    }
    s.swap(out);
    return replaced;
}

bool has_bom(std::string_view s) {
    return s.size() >= 3 && (unsigned char)s[0] == 0xEF && (unsigned char)s[1] == 0xBB && (unsigned char)s[2] == 0xBF;
}

void append_codepoint(std::string& out, char32_t cp) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

}  // namespace utf8
}  // namespace hilex
