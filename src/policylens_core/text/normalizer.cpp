#include "policylens_core/text/normalizer.hpp"

#include <iostream>
#include <utility>

#include "policylens_core/errors.hpp"
#include "policylens_core/text/utf8_text.hpp"

namespace policylens_core {

namespace {

// Applied in order: the mis-decoded sequences first, then the code points they stand for.
const std::vector<std::pair<std::string, std::string>> &substitution_table() {
  // "â€" is what the first two bytes of U+2013..U+2026 become when UTF-8 is read as cp1252.
  static const std::string mojibake = "\xC3\xA2\xE2\x82\xAC";
  static const std::vector<std::pair<std::string, std::string>> table = {
      {mojibake + "\xE2\x80\x9D", "--"},            // em dash
      {mojibake + "\xE2\x80\x9C", "-"},             // en dash
      {mojibake + "\xE2\x84\xA2", "'"},             // right single quote
      {mojibake + "\xCB\x9C", "'"},                 // left single quote
      {mojibake + "\xC5\x93", "\""},                // left double quote
      {mojibake + "\xC2\x9D", "\""},                // right double quote
      {mojibake + "\xC2\xA2", "\xE2\x80\xA2"},       // bullet
      {mojibake + "\xC2\xA6", "..."},               // ellipsis
      {"\xC3\x82\xC2\xA0", " "},                      // non-breaking space
      {"\xC3\x82", ""},
      {"\xE2\x80\x93", "-"},
      {"\xE2\x80\x94", "--"},
      {"\xE2\x80\x98", "'"},
      {"\xE2\x80\x99", "'"},
      {"\xE2\x80\x9C", "\""},
      {"\xE2\x80\x9D", "\""},
      {"\xE2\x80\xA6", "..."},
      {"\xC2\xA0", " "},
  };
  return table;
}

const std::regex &page_number_line() {
  // "23", "Page 23", "Page 23 of 40", "23 of 40"
  static const std::regex pattern(R"(^(page\s+)?\d+(\s+of\s+\d+)?$)", std::regex::icase);
  return pattern;
}

const std::regex &bracketed_page_segment() {
  // "Oscar Health Insurance | Page 23 | January 2026"
  static const std::regex pattern(R"((^|\|)\s*page\s+\d+(\s+of\s+\d+)?\s*(\||$))",
                                  std::regex::icase);
  return pattern;
}

void replace_all(std::string &text, const std::string &from, const std::string &to) {
  if (from.empty()) {
    return;
  }
  size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::vector<std::string> split_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::string current;
  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\r' || c == '\n') {
      lines.push_back(std::move(current));
      current.clear();
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
    } else {
      current += c;
    }
  }
  lines.push_back(std::move(current));
  return lines;
}

std::string join_lines(const std::vector<std::string> &lines) {
  std::string joined;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i > 0) {
      joined += '\n';
    }
    joined += lines[i];
  }
  return joined;
}

bool is_blank(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trim(const std::string &text) {
  size_t begin = 0;
  while (begin < text.size() && is_blank(text[begin])) {
    ++begin;
  }
  size_t end = text.size();
  while (end > begin && is_blank(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

bool ends_sentence(const std::string &line) {
  if (line.empty()) {
    return false;
  }
  char last = line.back();
  return last == '.' || last == '!' || last == '?' || last == ':';
}

// Collapses maximal runs of 3+ single-character tokens on one line. Runs are
// maximal, so a single pass already leaves no collapsible run behind.
std::string collapse_line(const std::string &line) {
  struct Piece {
    std::string separator;
    std::string token;
  };
  std::vector<Piece> pieces;
  std::string trailing;
  size_t i = 0;
  while (i < line.size()) {
    Piece piece;
    while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
      piece.separator += line[i++];
    }
    while (i < line.size() && line[i] != ' ' && line[i] != '\t') {
      piece.token += line[i++];
    }
    if (piece.token.empty()) {
      trailing = piece.separator;
    } else {
      pieces.push_back(std::move(piece));
    }
  }

  std::string out;
  size_t p = 0;
  while (p < pieces.size()) {
    size_t run_end = p;
    while (run_end < pieces.size() && text::is_single_word_char(pieces[run_end].token)) {
      ++run_end;
    }
    if (run_end - p >= 3) {
      out += pieces[p].separator;
      for (size_t k = p; k < run_end; ++k) {
        out += pieces[k].token;
      }
      p = run_end;
    } else {
      size_t stop = run_end == p ? p + 1 : run_end;
      for (size_t k = p; k < stop; ++k) {
        out += pieces[k].separator;
        out += pieces[k].token;
      }
      p = stop;
    }
  }
  out += trailing;
  return out;
}

}  // namespace

Normalizer::Normalizer(NormalizerOptions options) : options_(std::move(options)) {
  running_headers_.reserve(options_.running_header_patterns.size());
  for (const auto &pattern : options_.running_header_patterns) {
    if (pattern.empty()) {
      throw ConfigError("Running header pattern cannot be empty");
    }
    try {
      running_headers_.emplace_back(pattern, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error &e) {
      throw ConfigError("Invalid running header pattern '" + pattern + "': " + e.what());
    }
  }
}

std::string Normalizer::normalize(const std::string &raw_text) const {
  if (trim(raw_text).empty()) {
    return "";
  }

  std::string text = repair_encoding(raw_text);
  if (options_.remove_boilerplate) {
    text = remove_boilerplate(text);
  }
  text = collapse_spaced_letters(text);
  text = reflow_lines(text);
  return normalize_whitespace(text);
}

std::string Normalizer::repair_encoding(std::string text) {
  for (const auto &[from, to] : substitution_table()) {
    replace_all(text, from, to);
  }
  return text;
}

bool Normalizer::is_boilerplate_line(const std::string &trimmed_line) const {
  if (trimmed_line.empty()) {
    return false;
  }
  try {
    if (std::regex_match(trimmed_line, page_number_line())) {
      return true;
    }
    if (trimmed_line.find('|') != std::string::npos &&
        std::regex_search(trimmed_line, bracketed_page_segment())) {
      return true;
    }
    for (const auto &header : running_headers_) {
      if (std::regex_match(trimmed_line, header)) {
        return true;
      }
    }
  } catch (const std::regex_error &e) {
    // Pathological lines can exhaust the regex engine; such a line is kept as text.
    std::cerr << "Warning: boilerplate check skipped a line: " << e.what() << std::endl;
  }
  return false;
}

std::string Normalizer::remove_boilerplate(const std::string &text) const {
  std::vector<std::string> kept;
  for (auto &line : split_lines(text)) {
    if (!is_boilerplate_line(trim(line))) {
      kept.push_back(std::move(line));
    }
  }
  return join_lines(kept);
}

std::string Normalizer::collapse_spaced_letters(const std::string &text) {
  std::vector<std::string> lines = split_lines(text);
  for (auto &line : lines) {
    line = collapse_line(line);
  }
  return join_lines(lines);
}

std::string Normalizer::reflow_lines(const std::string &text) {
  std::vector<std::string> paragraphs;
  std::string current;

  for (const auto &raw_line : split_lines(text)) {
    std::string line = trim(raw_line);
    if (line.empty()) {
      if (!current.empty()) {
        paragraphs.push_back(std::move(current));
        current.clear();
      }
      // one blank line per paragraph break
      if (!paragraphs.empty() && !paragraphs.back().empty()) {
        paragraphs.emplace_back();
      }
      continue;
    }

    if (!current.empty()) {
      current += ' ';
    }
    current += line;
    if (ends_sentence(line)) {
      paragraphs.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    paragraphs.push_back(std::move(current));
  }
  return join_lines(paragraphs);
}

std::string Normalizer::normalize_whitespace(const std::string &text) {
  std::string unified = text;
  replace_all(unified, "\t", " ");

  std::vector<std::string> cleaned;
  bool previous_empty = false;
  for (const auto &line : split_lines(unified)) {
    std::string squeezed;
    squeezed.reserve(line.size());
    for (char c : line) {
      if (c == ' ' && !squeezed.empty() && squeezed.back() == ' ') {
        continue;
      }
      squeezed += c;
    }
    squeezed = trim(squeezed);

    if (!squeezed.empty()) {
      cleaned.push_back(std::move(squeezed));
      previous_empty = false;
    } else if (!previous_empty) {
      cleaned.emplace_back();
      previous_empty = true;
    }
  }
  return trim(join_lines(cleaned));
}

}  // namespace policylens_core
