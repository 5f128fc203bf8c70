#include "policylens_core/types.hpp"

#include "policylens_core/errors.hpp"

namespace policylens_core {

namespace {

const nlohmann::json *find_field(const nlohmann::json &object,
                                 const char *name,
                                 const char *legacy_name) {
  auto it = object.find(name);
  if (it != object.end()) {
    return &*it;
  }
  it = object.find(legacy_name);
  if (it != object.end()) {
    return &*it;
  }
  return nullptr;
}

}  // namespace

void validate_page(const Page &page) {
  if (page.source_id.empty()) {
    throw ParseInputError("Page record has an empty source_id");
  }
  if (page.page_number < 1) {
    throw ParseInputError("Page record from '" + page.source_id +
                          "' has invalid page_number " + std::to_string(page.page_number));
  }
}

Page page_from_json(const nlohmann::json &json_page) {
  if (!json_page.is_object()) {
    throw ParseInputError("Page record must be a JSON object");
  }

  const nlohmann::json *source = find_field(json_page, "source_id", "source");
  if (!source || !source->is_string()) {
    throw ParseInputError("Page record is missing string field 'source_id'");
  }
  const nlohmann::json *page_number = find_field(json_page, "page_number", "page_num");
  if (!page_number || !page_number->is_number_integer()) {
    throw ParseInputError("Page record is missing integer field 'page_number'");
  }
  const nlohmann::json *raw_text = find_field(json_page, "raw_text", "text");
  if (!raw_text || !raw_text->is_string()) {
    throw ParseInputError("Page record is missing string field 'raw_text'");
  }

  Page page;
  page.source_id = source->get<std::string>();
  page.page_number = page_number->get<int>();
  page.raw_text = raw_text->get<std::string>();
  validate_page(page);
  return page;
}

void to_json(nlohmann::json &json_chunk, const Chunk &chunk) {
  json_chunk = nlohmann::json{{"text", chunk.text},
                              {"source_id", chunk.source_id},
                              {"page_number", chunk.page_number},
                              {"chunk_index", chunk.chunk_index},
                              {"chunk_id", chunk.chunk_id},
                              {"region", chunk.region},
                              {"category", chunk.category}};
}

// Every field is required; nlohmann throws on a missing key or wrong type.
void from_json(const nlohmann::json &json_chunk, Chunk &chunk) {
  json_chunk.at("text").get_to(chunk.text);
  json_chunk.at("source_id").get_to(chunk.source_id);
  json_chunk.at("page_number").get_to(chunk.page_number);
  json_chunk.at("chunk_index").get_to(chunk.chunk_index);
  json_chunk.at("chunk_id").get_to(chunk.chunk_id);
  json_chunk.at("region").get_to(chunk.region);
  json_chunk.at("category").get_to(chunk.category);
}

void to_json(nlohmann::json &json_result, const SearchResult &result) {
  json_result = result.chunk;
  json_result["score"] = result.score;
  json_result["rank"] = result.rank;
}

}  // namespace policylens_core
