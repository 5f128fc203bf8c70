#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace policylens_core {

/**
 * @class Segmenter
 * @brief Splits normalized text into overlapping chunks on sentence boundaries.
 *
 * Sizes are counted in code points. A chunk never exceeds target_size unless it is a
 * single sentence unit that is longer than target_size on its own; units are never
 * split. Each chunk after the first starts with up to `overlap` trailing characters of
 * the chunk before it.
 */
class Segmenter {
 public:
  // Throws ConfigError unless 0 < overlap < target_size.
  Segmenter(int target_size, int overlap);

  std::vector<std::string> segment(const std::string &text) const;

  // Sentence-like units: text up to and including terminal punctuation (. ! ? :) and the
  // whitespace that follows it. Whitespace-only units are dropped.
  static std::vector<std::string> split_units(const std::string &text);

  size_t target_size() const {
    return target_size_;
  }
  size_t overlap() const {
    return overlap_;
  }

 private:
  size_t target_size_;
  size_t overlap_;

  std::string overlap_seed(const std::string &closed_chunk, size_t next_unit_length) const;
};

// One-shot form of Segmenter(target_size, overlap).segment(text).
std::vector<std::string> segment_text(const std::string &text, int target_size, int overlap);

}  // namespace policylens_core
