#include "policylens_core/tagging/label_table.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace policylens_core {

namespace {

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string separators_to_spaces(std::string text) {
  std::replace(text.begin(), text.end(), '_', ' ');
  std::replace(text.begin(), text.end(), '-', ' ');
  return text;
}

std::vector<std::string> alnum_tokens(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
      current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

struct StateEntry {
  const char *code;
  const char *name;
};

const std::vector<StateEntry> &us_states() {
  static const std::vector<StateEntry> states = {
      {"AL", "alabama"},        {"AK", "alaska"},         {"AZ", "arizona"},
      {"AR", "arkansas"},       {"CA", "california"},     {"CO", "colorado"},
      {"CT", "connecticut"},    {"DE", "delaware"},       {"FL", "florida"},
      {"GA", "georgia"},        {"HI", "hawaii"},         {"ID", "idaho"},
      {"IL", "illinois"},       {"IN", "indiana"},        {"IA", "iowa"},
      {"KS", "kansas"},         {"KY", "kentucky"},       {"LA", "louisiana"},
      {"ME", "maine"},          {"MD", "maryland"},       {"MA", "massachusetts"},
      {"MI", "michigan"},       {"MN", "minnesota"},      {"MS", "mississippi"},
      {"MO", "missouri"},       {"MT", "montana"},        {"NE", "nebraska"},
      {"NV", "nevada"},         {"NH", "new hampshire"},  {"NJ", "new jersey"},
      {"NM", "new mexico"},     {"NY", "new york"},       {"NC", "north carolina"},
      {"ND", "north dakota"},   {"OH", "ohio"},           {"OK", "oklahoma"},
      {"OR", "oregon"},         {"PA", "pennsylvania"},   {"RI", "rhode island"},
      {"SC", "south carolina"}, {"SD", "south dakota"},   {"TN", "tennessee"},
      {"TX", "texas"},          {"UT", "utah"},           {"VT", "vermont"},
      {"VA", "virginia"},       {"WA", "washington"},     {"WV", "west virginia"},
      {"WI", "wisconsin"},      {"WY", "wyoming"},
  };
  return states;
}

}  // namespace

LabelTable::LabelTable(std::string fallback) : fallback_(std::move(fallback)) {}

LabelTable &LabelTable::add_rule(std::string label, Predicate predicate) {
  rules_.push_back({std::move(label), std::move(predicate)});
  return *this;
}

std::optional<std::string> LabelTable::match(const std::string &subject) const {
  for (const auto &rule : rules_) {
    if (rule.matches(subject)) {
      return rule.label;
    }
  }
  return std::nullopt;
}

std::string LabelTable::classify(const std::string &subject) const {
  return match(subject).value_or(fallback_);
}

LabelTable::Predicate contains_any(std::vector<std::string> keywords) {
  for (auto &keyword : keywords) {
    keyword = separators_to_spaces(to_lower(keyword));
  }
  return [keywords = std::move(keywords)](const std::string &subject) {
    std::string haystack = separators_to_spaces(to_lower(subject));
    return std::any_of(keywords.begin(), keywords.end(), [&](const std::string &keyword) {
      return haystack.find(keyword) != std::string::npos;
    });
  };
}

LabelTable::Predicate has_token(std::string token) {
  token = to_lower(std::move(token));
  return [token = std::move(token)](const std::string &subject) {
    auto tokens = alnum_tokens(subject);
    return std::find(tokens.begin(), tokens.end(), token) != tokens.end();
  };
}

LabelTable LabelTable::us_state_regions() {
  LabelTable table;
  for (const auto &state : us_states()) {
    table.add_rule(state.code, has_token(state.code));
  }

  // A name that ends with another state's name has to be tried first.
  std::vector<StateEntry> by_name = us_states();
  std::stable_partition(by_name.begin(), by_name.end(), [&](const StateEntry &entry) {
    std::string name = entry.name;
    return std::any_of(us_states().begin(), us_states().end(), [&](const StateEntry &other) {
      std::string suffix = other.name;
      return suffix.size() < name.size() &&
             name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
    });
  });
  for (const auto &state : by_name) {
    table.add_rule(state.code, contains_any({state.name}));
  }
  return table;
}

LabelTable LabelTable::document_categories() {
  LabelTable table;
  table.add_rule("formulary", contains_any({"formulary", "drug", "medication", "tier"}))
      .add_rule("faq", contains_any({"faq", "question", "answer"}))
      .add_rule("network", contains_any({"network", "provider", "doctor", "physician"}))
      .add_rule("summary", contains_any({"summary", "benefit", "coverage"}));
  return table;
}

}  // namespace policylens_core
