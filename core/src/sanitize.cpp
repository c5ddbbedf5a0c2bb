#include "psguard/sanitize.h"

#include <cstdint>

namespace psguard {

// Length of the well-formed UTF-8 sequence starting at s[i], or 0.
static size_t utf8_seq_len(const std::string& s, size_t i) {
    const auto b0 = static_cast<uint8_t>(s[i]);
    if (b0 < 0x80) return 1;

    size_t need = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;
    if ((b0 & 0xE0) == 0xC0) { need = 1; cp = b0 & 0x1F; min_cp = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { need = 2; cp = b0 & 0x0F; min_cp = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { need = 3; cp = b0 & 0x07; min_cp = 0x10000; }
    else return 0;

    if (i + need >= s.size()) return 0;             // truncated
    for (size_t k = 1; k <= need; k++) {
        const auto b = static_cast<uint8_t>(s[i + k]);
        if ((b & 0xC0) != 0x80) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    if (cp < min_cp) return 0;                      // overlong
    if (cp > 0x10FFFF) return 0;
    if (cp >= 0xD800 && cp <= 0xDFFF) return 0;     // surrogate
    return need + 1;
}

bool is_valid_utf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        size_t n = utf8_seq_len(s, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

static bool keep_ascii(unsigned char c, bool allow_cr) {
    if (c == '\n' || c == '\t') return true;
    if (allow_cr && c == '\r') return true;
    return c >= 0x20 && c <= 0x7E;
}

std::string sanitize_input(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (keep_ascii(static_cast<unsigned char>(c), false)) out.push_back(c);
    }
    return out;
}

std::string sanitize_script(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            if (keep_ascii(c, true)) out.push_back(static_cast<char>(c));
            i++;
            continue;
        }
        size_t n = utf8_seq_len(s, i);
        if (n == 0) { i++; continue; }   // stray byte
        out.append(s, i, n);
        i += n;
    }
    return out;
}

} // namespace psguard
