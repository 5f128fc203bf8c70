#pragma once

#include <nlohmann/json.hpp>

#include "policylens_core/types/chunk.hpp"

namespace policylens_core {

// score is the squared L2 distance to the query: LOWER means MORE similar.
// This is the opposite sense of a cosine similarity.
struct SearchResult {
  Chunk chunk;
  float score = 0.0f;
  int rank = 0;  // 0-based
};

void to_json(nlohmann::json &json_result, const SearchResult &result);

}  // namespace policylens_core
