#pragma once

#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "policylens_core/types/chunk.hpp"

namespace policylens_core {

// Sizes are in code points. Every field is 0 for an empty chunk set.
struct ChunkStats {
  size_t total_chunks = 0;
  size_t avg_chunk_size = 0;  // truncated
  size_t min_chunk_size = 0;
  size_t max_chunk_size = 0;
  size_t total_chars = 0;
};

struct MetadataSummary {
  size_t total_chunks = 0;
  std::map<std::string, size_t> regions;
  std::map<std::string, size_t> categories;
  size_t unique_pages = 0;
  std::string page_range = "N/A";  // "min-max"
};

ChunkStats chunk_stats(const std::vector<Chunk> &chunks);
MetadataSummary metadata_summary(const std::vector<Chunk> &chunks);

void to_json(nlohmann::json &json_stats, const ChunkStats &stats);
void to_json(nlohmann::json &json_summary, const MetadataSummary &summary);

}  // namespace policylens_core
