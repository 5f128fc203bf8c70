#pragma once

#include <cstddef>
#include <string>

namespace policylens_core::text {

// Length in code points; falls back to bytes for text that is not valid UTF-8.
size_t char_length(const std::string &text);

// The last `count` code points of `text` (bytes for invalid UTF-8).
std::string tail_chars(const std::string &text, size_t count);

// True for a token made of exactly one letter or digit.
bool is_single_word_char(const std::string &token);

}  // namespace policylens_core::text
