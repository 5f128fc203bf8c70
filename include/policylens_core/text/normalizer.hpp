#pragma once

#include <regex>
#include <string>
#include <vector>

namespace policylens_core {

struct NormalizerOptions {
  bool remove_boilerplate = true;
  // Case-insensitive regexes; a line that matches one of them entirely is a running
  // header/footer and gets dropped.
  std::vector<std::string> running_header_patterns = {"Oscar Health Insurance", "Confidential"};
};

/**
 * @class Normalizer
 * @brief Cleans raw page text extracted from PDFs before it is segmented.
 *
 * Stages run in a fixed order, each one relying on the previous:
 *   1. encoding repair (mojibake and typographic punctuation)
 *   2. boilerplate removal (page numbers, bracketed headers, running headers)
 *   3. collapse of glyph-spaced words ("M e t f o r m i n" -> "Metformin")
 *   4. line-break reflow into paragraphs
 *   5. whitespace normalization
 *
 * normalize() is pure and never throws on text input. Invalid header patterns are
 * rejected by the constructor with ConfigError.
 */
class Normalizer {
 public:
  explicit Normalizer(NormalizerOptions options = {});

  std::string normalize(const std::string &raw_text) const;

  // Individual stages.
  static std::string repair_encoding(std::string text);
  std::string remove_boilerplate(const std::string &text) const;
  static std::string collapse_spaced_letters(const std::string &text);
  static std::string reflow_lines(const std::string &text);
  static std::string normalize_whitespace(const std::string &text);

  const NormalizerOptions &options() const {
    return options_;
  }

 private:
  NormalizerOptions options_;
  std::vector<std::regex> running_headers_;

  bool is_boilerplate_line(const std::string &trimmed_line) const;
};

}  // namespace policylens_core
