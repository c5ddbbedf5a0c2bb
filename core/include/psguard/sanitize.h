#pragma once
#include <string>

namespace psguard {

// True if `s` is well-formed UTF-8 (no overlongs, surrogates or code points
// above U+10FFFF).
bool is_valid_utf8(const std::string& s);

// Keep printable ASCII (0x20..0x7E), tab and newline. Everything else,
// including NUL, CR and all bytes >= 0x80, is dropped. Idempotent.
std::string sanitize_input(const std::string& s);

// Script variant: additionally keeps CR and well-formed non-ASCII UTF-8
// sequences. Idempotent.
std::string sanitize_script(const std::string& s);

} // namespace psguard
