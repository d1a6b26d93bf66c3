#ifndef UTF8_HPP
#define UTF8_HPP

#include <string>
#include <string_view>

namespace Utils {

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

// Decodes UTF-8 into code points. Malformed or truncated sequences decode to
// one U+FFFD per offending byte so every input byte is accounted for
std::u32string utf8_decode(std::string_view input);

std::string utf8_encode(char32_t code_point);
std::string utf8_encode(std::u32string_view code_points);

// Unicode White_Space, plus the ASCII separators U+001C..U+001F
bool is_unicode_space(char32_t code_point);

// Drops leading and trailing whitespace as defined by is_unicode_space().
// Interior bytes, malformed ones included, are kept unchanged
std::string utf8_trim(std::string_view input);

// Drops a leading byte order mark, if any
std::string_view strip_utf8_bom(std::string_view input);

} // namespace Utils

#endif // UTF8_HPP
