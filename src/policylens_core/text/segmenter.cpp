#include "policylens_core/text/segmenter.hpp"

#include <algorithm>
#include <cctype>

#include "policylens_core/errors.hpp"
#include "policylens_core/text/utf8_text.hpp"

namespace policylens_core {

namespace {

bool is_space(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool is_terminal(char c) {
  return c == '.' || c == '!' || c == '?' || c == ':';
}

std::string trim(const std::string &text) {
  auto begin = std::find_if_not(text.begin(), text.end(), is_space);
  auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::string trim_right(const std::string &text) {
  auto end = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
  return std::string(text.begin(), end);
}

}  // namespace

Segmenter::Segmenter(int target_size, int overlap) {
  if (target_size <= 0) {
    throw ConfigError("target_size must be positive, got " + std::to_string(target_size));
  }
  if (overlap <= 0) {
    throw ConfigError("overlap must be positive, got " + std::to_string(overlap));
  }
  if (overlap >= target_size) {
    throw ConfigError("overlap (" + std::to_string(overlap) + ") must be smaller than target_size (" +
                      std::to_string(target_size) + ")");
  }
  target_size_ = static_cast<size_t>(target_size);
  overlap_ = static_cast<size_t>(overlap);
}

std::vector<std::string> Segmenter::split_units(const std::string &text) {
  std::vector<std::string> units;
  size_t start = 0;
  size_t i = 0;
  while (i < text.size()) {
    if (is_terminal(text[i]) && i + 1 < text.size() && is_space(text[i + 1])) {
      size_t end = i + 1;
      while (end < text.size() && is_space(text[end])) {
        ++end;
      }
      units.push_back(text.substr(start, end - start));
      start = end;
      i = end;
    } else {
      ++i;
    }
  }
  if (start < text.size()) {
    units.push_back(text.substr(start));
  }

  units.erase(std::remove_if(units.begin(), units.end(),
                             [](const std::string &unit) { return trim(unit).empty(); }),
              units.end());
  return units;
}

// The overlap is shortened so that seed + unit still fits in target_size; a unit that
// is too long on its own gets no seed at all.
std::string Segmenter::overlap_seed(const std::string &closed_chunk,
                                    size_t next_unit_length) const {
  if (text::char_length(closed_chunk) <= overlap_ || next_unit_length >= target_size_) {
    return "";
  }
  size_t take = std::min(overlap_, target_size_ - next_unit_length);
  return text::tail_chars(closed_chunk, take);
}

std::vector<std::string> Segmenter::segment(const std::string &text) const {
  std::vector<std::string> chunks;
  std::string buffer;
  size_t buffer_length = 0;

  // Units never begin with whitespace once the text is trimmed, so only a carried-over
  // seed can open a chunk with a space; chunks are therefore trimmed on the right only.
  for (const auto &unit : split_units(trim(text))) {
    size_t unit_length = text::char_length(unit);

    if (buffer.empty()) {
      buffer = unit;
      buffer_length = unit_length;
      continue;
    }

    if (buffer_length + unit_length > target_size_) {
      std::string closed = trim_right(buffer);
      if (!trim(closed).empty()) {
        chunks.push_back(closed);
      }
      std::string seed = overlap_seed(closed, unit_length);
      buffer = seed + unit;
      buffer_length = text::char_length(seed) + unit_length;
    } else {
      buffer += unit;
      buffer_length += unit_length;
    }
  }

  std::string last = trim_right(buffer);
  if (!trim(last).empty()) {
    chunks.push_back(last);
  }
  return chunks;
}

std::vector<std::string> segment_text(const std::string &text, int target_size, int overlap) {
  return Segmenter(target_size, overlap).segment(text);
}

}  // namespace policylens_core
