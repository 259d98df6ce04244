#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace hilex {
namespace utf8 {

// Byte length of the well-formed sequence starting at `pos`, or 1 when the
// byte at `pos` does not start one (stray continuation byte, bad lead byte,
// truncated sequence). Returns 0 at or past the end of `s`.
size_t sequence_length(std::string_view s, size_t pos);

// Strict validation; `bad_off` receives the offset of the first bad byte.
bool validate(std::string_view s, size_t& bad_off);

// Replaces every ill-formed byte with U+FFFD. Returns the number of replacements.
size_t sanitize(std::string& s);

std::string from_latin1(std::string_view bytes);

// Non-ASCII bytes become U+FFFD. Returns the number of replacements.
size_t sanitize_ascii(std::string& s);

bool has_bom(std::string_view s);

void append_codepoint(std::string& out, char32_t cp);

}  // namespace utf8
}  // namespace hilex
