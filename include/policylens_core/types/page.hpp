#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace policylens_core {

// One page of extracted document text, as handed over by the PDF parser.
struct Page {
  std::string source_id;
  int page_number = 0;  // 1-based
  std::string raw_text;
};

// Throws ParseInputError when source_id is empty or page_number < 1.
void validate_page(const Page &page);

// Accepts {"source_id", "page_number", "raw_text"} as well as the parser's
// legacy {"source", "page_num", "text"} spelling. Throws ParseInputError.
Page page_from_json(const nlohmann::json &json_page);

}  // namespace policylens_core
