#include "safepath/char_filter.hpp"

namespace safepath {

namespace {

struct Decoded {
    std::uint32_t code_point;
    std::size_t length;  // 0 when the bytes at this offset are not well-formed
};

bool in_range(unsigned char c, unsigned char lo, unsigned char hi) {
    return c >= lo && c <= hi;
}

// Decode one UTF-8 sequence, rejecting overlong forms, surrogates and
// values above U+10FFFF.
Decoded decode_at(const std::string& s, std::size_t i) {
    const auto b0 = static_cast<unsigned char>(s[i]);
    const std::size_t remaining = s.size() - i;

    if (b0 < 0x80) {
        return {b0, 1};
    }

    std::size_t length = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    std::uint32_t cp = 0;

    if (in_range(b0, 0xC2, 0xDF)) {
        length = 2;
        cp = b0 & 0x1Fu;
    } else if (in_range(b0, 0xE0, 0xEF)) {
        length = 3;
        cp = b0 & 0x0Fu;
        if (b0 == 0xE0) lo = 0xA0;
        if (b0 == 0xED) hi = 0x9F;
    } else if (in_range(b0, 0xF0, 0xF4)) {
        length = 4;
        cp = b0 & 0x07u;
        if (b0 == 0xF0) lo = 0x90;
        if (b0 == 0xF4) hi = 0x8F;
    } else {
        return {0, 0};
    }

    if (remaining < length) {
        return {0, 0};
    }

    for (std::size_t k = 1; k < length; ++k) {
        const auto b = static_cast<unsigned char>(s[i + k]);
        // only the second byte has a narrowed range
        const unsigned char min = (k == 1) ? lo : 0x80;
        const unsigned char max = (k == 1) ? hi : 0xBF;
        if (!in_range(b, min, max)) {
            return {0, 0};
        }
        cp = (cp << 6) | (b & 0x3Fu);
    }

    return {cp, length};
}

std::size_t sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 1;
}

} // namespace

bool is_blacklisted(std::uint32_t code_point) {
    if (code_point < 32) return true;
    if (code_point >= 127 && code_point <= 160) return true;
    switch (code_point) {
        case '<':
        case '>':
        case ':':
        case '"':
        case '|':
        case '?':
        case '*':
        case '\\':
        case '/':
            return true;
        default:
            return false;
    }
}

std::string filter_characters(const std::string& node) {
    std::string out;
    out.reserve(node.size());

    std::size_t i = 0;
    while (i < node.size()) {
        Decoded d = decode_at(node, i);
        if (d.length == 0) {
            out.push_back(kReplacementChar);
            ++i;
            continue;
        }
        if (is_blacklisted(d.code_point)) {
            out.push_back(kReplacementChar);
        } else {
            out.append(node, i, d.length);
        }
        i += d.length;
    }

    return out;
}

std::size_t code_point_length(const std::string& utf8) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < utf8.size();
         i += sequence_length(static_cast<unsigned char>(utf8[i]))) {
        ++count;
    }
    return count;
}

std::string truncate_code_points(const std::string& utf8, std::size_t max_code_points) {
    std::size_t i = 0;
    std::size_t count = 0;
    while (i < utf8.size() && count < max_code_points) {
        i += sequence_length(static_cast<unsigned char>(utf8[i]));
        ++count;
    }
    if (i > utf8.size()) i = utf8.size();
    return utf8.substr(0, i);
}

std::string trim_whitespace(const std::string& s) {
    // std::isspace would also match 0x85 and 0xA0 under a Latin-1 locale
    auto start = s.find_first_not_of(kAsciiWhitespace);
    if (start == std::string::npos) {
        return "";
    }
    auto end = s.find_last_not_of(kAsciiWhitespace);
    return s.substr(start, end - start + 1);
}

} // namespace safepath
