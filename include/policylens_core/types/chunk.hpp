#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace policylens_core {

inline constexpr const char *UNKNOWN_LABEL = "unknown";

struct Chunk {
  std::string text;
  std::string source_id;
  int page_number = 0;
  int chunk_index = 0;  // position among the chunks of its page
  std::string chunk_id;
  std::string region = UNKNOWN_LABEL;
  std::string category = UNKNOWN_LABEL;
};

struct EmbeddedChunk {
  Chunk chunk;
  std::vector<float> embedding;
};

void to_json(nlohmann::json &json_chunk, const Chunk &chunk);
void from_json(const nlohmann::json &json_chunk, Chunk &chunk);

}  // namespace policylens_core
