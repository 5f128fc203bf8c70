#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "policylens_core/types/chunk.hpp"

namespace policylens_core {

/**
 * @class LabelTable
 * @brief Ordered predicate -> label rules with a fallback label.
 *
 * classify() walks the rules in insertion order and returns the label of the first rule
 * whose predicate accepts the subject; when none does it returns the fallback.
 */
class LabelTable {
 public:
  using Predicate = std::function<bool(const std::string &)>;

  struct Rule {
    std::string label;
    Predicate matches;
  };

  explicit LabelTable(std::string fallback = UNKNOWN_LABEL);

  LabelTable &add_rule(std::string label, Predicate predicate);

  std::optional<std::string> match(const std::string &subject) const;
  std::string classify(const std::string &subject) const;

  const std::vector<Rule> &rules() const {
    return rules_;
  }
  const std::string &fallback() const {
    return fallback_;
  }

  // Two-letter US state codes as whole file-name tokens, then full state names.
  static LabelTable us_state_regions();
  // formulary -> faq -> network -> summary keyword buckets.
  static LabelTable document_categories();

 private:
  std::vector<Rule> rules_;
  std::string fallback_;
};

// Case-insensitive: true when the subject contains any of the keywords. '_' and '-' in
// the subject are read as spaces.
LabelTable::Predicate contains_any(std::vector<std::string> keywords);

// Case-insensitive: true when the subject, split on non-alphanumeric bytes, has a token
// equal to `token`.
LabelTable::Predicate has_token(std::string token);

}  // namespace policylens_core
