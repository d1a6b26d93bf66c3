#include "utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace Utils {

namespace {

bool is_continuation(unsigned char byte) { return (byte & 0xC0) == 0x80; }

// Decodes the sequence at `pos`. `length` receives the bytes consumed, which
// is 1 for any malformed or truncated sequence
char32_t decode_next(std::string_view input, size_t pos, size_t &length) {
  unsigned char c = static_cast<unsigned char>(input[pos]);
  length = 1;

  size_t expected = 0;
  char32_t cp = 0;
  char32_t min_value = 0;
  if (c < 0x80) {
    return c;
  } else if ((c & 0xE0) == 0xC0) {
    expected = 2;
    cp = c & 0x1F;
    min_value = 0x80;
  } else if ((c & 0xF0) == 0xE0) {
    expected = 3;
    cp = c & 0x0F;
    min_value = 0x800;
  } else if ((c & 0xF8) == 0xF0) {
    expected = 4;
    cp = c & 0x07;
    min_value = 0x10000;
  } else {
    return REPLACEMENT_CHARACTER;
  }

  if (pos + expected > input.size())
    return REPLACEMENT_CHARACTER;

  for (size_t k = 1; k < expected; ++k) {
    unsigned char next = static_cast<unsigned char>(input[pos + k]);
    if (!is_continuation(next))
      return REPLACEMENT_CHARACTER;
    cp = (cp << 6) | (next & 0x3F);
  }

  // Overlong forms, surrogates and values past U+10FFFF are rejected
  if (cp < min_value || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
    return REPLACEMENT_CHARACTER;

  length = expected;
  return cp;
}

} // namespace

std::u32string utf8_decode(std::string_view input) {
  std::u32string result;
  result.reserve(input.size());

  size_t pos = 0;
  while (pos < input.size()) {
    size_t length = 0;
    result.push_back(decode_next(input, pos, length));
    pos += length;
  }
  return result;
}

bool is_unicode_space(char32_t cp) {
  switch (cp) {
  case 0x0085: // Next line
  case 0x00A0: // No-break space
  case 0x1680:
  case 0x2028:
  case 0x2029:
  case 0x202F:
  case 0x205F:
  case 0x3000: // Ideographic space
    return true;
  default:
    break;
  }
  // U+0009..U+000D, U+001C..U+0020 and U+2000..U+200A
  return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) ||
         (cp >= 0x2000 && cp <= 0x200A);
}

std::string utf8_trim(std::string_view input) {
  size_t begin = input.size();
  size_t end = 0;

  size_t pos = 0;
  while (pos < input.size()) {
    size_t length = 0;
    char32_t cp = decode_next(input, pos, length);
    if (!is_unicode_space(cp)) {
      if (begin == input.size())
        begin = pos;
      end = pos + length;
    }
    pos += length;
  }

  if (begin >= end)
    return std::string();
  return std::string(input.substr(begin, end - begin));
}

std::string utf8_encode(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out += static_cast<char>(cp);
  } else if (cp < 0x800) {
    out += static_cast<char>(0xC0 | (cp >> 6));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else if (cp < 0x10000) {
    out += static_cast<char>(0xE0 | (cp >> 12));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  } else {
    out += static_cast<char>(0xF0 | (cp >> 18));
    out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
    out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
    out += static_cast<char>(0x80 | (cp & 0x3F));
  }
  return out;
}

std::string utf8_encode(std::u32string_view code_points) {
  std::string out;
  out.reserve(code_points.size() * 3);
  for (char32_t cp : code_points)
    out += utf8_encode(cp);
  return out;
}

std::string_view strip_utf8_bom(std::string_view input) {
  if (input.size() >= 3 && input.substr(0, 3) == "\xEF\xBB\xBF")
    return input.substr(3);
  return input;
}

} // namespace Utils
