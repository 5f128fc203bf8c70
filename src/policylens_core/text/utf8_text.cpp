#include "policylens_core/text/utf8_text.hpp"

#include <utf8.h>

#include <cctype>
#include <cstdint>

namespace policylens_core::text {

size_t char_length(const std::string &text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.size();
  }
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string tail_chars(const std::string &text, size_t count) {
  if (count == 0) {
    return "";
  }
  if (!utf8::is_valid(text.begin(), text.end())) {
    return count >= text.size() ? text : text.substr(text.size() - count);
  }

  auto it = text.end();
  for (size_t taken = 0; taken < count && it != text.begin(); ++taken) {
    utf8::prior(it, text.begin());
  }
  return std::string(it, text.end());
}

bool is_single_word_char(const std::string &token) {
  if (token.size() == 1) {
    return std::isalnum(static_cast<unsigned char>(token[0])) != 0;
  }
  if (token.empty() || !utf8::is_valid(token.begin(), token.end()) ||
      utf8::distance(token.begin(), token.end()) != 1) {
    return false;
  }
  auto it = token.begin();
  uint32_t code_point = utf8::next(it, token.end());
  // Latin-1 punctuation/symbols and the General Punctuation block are not letters.
  if (code_point < 0xC0 || (code_point >= 0x2000 && code_point <= 0x206F)) {
    return false;
  }
  return code_point != 0xD7 && code_point != 0xF7;
}

}  // namespace policylens_core::text
