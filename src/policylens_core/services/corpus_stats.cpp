#include "policylens_core/services/corpus_stats.hpp"

#include <algorithm>
#include <set>

#include "policylens_core/text/utf8_text.hpp"

namespace policylens_core {

ChunkStats chunk_stats(const std::vector<Chunk> &chunks) {
  ChunkStats stats;
  if (chunks.empty()) {
    return stats;
  }

  stats.total_chunks = chunks.size();
  stats.min_chunk_size = text::char_length(chunks.front().text);
  for (const auto &chunk : chunks) {
    size_t size = text::char_length(chunk.text);
    stats.total_chars += size;
    stats.min_chunk_size = std::min(stats.min_chunk_size, size);
    stats.max_chunk_size = std::max(stats.max_chunk_size, size);
  }
  stats.avg_chunk_size = stats.total_chars / stats.total_chunks;
  return stats;
}

MetadataSummary metadata_summary(const std::vector<Chunk> &chunks) {
  MetadataSummary summary;
  summary.total_chunks = chunks.size();

  // Page numbers are only unique within a source, but the summary counts distinct
  // numbers across the whole set.
  std::set<int> pages;
  for (const auto &chunk : chunks) {
    summary.regions[chunk.region]++;
    summary.categories[chunk.category]++;
    if (chunk.page_number > 0) {
      pages.insert(chunk.page_number);
    }
  }

  summary.unique_pages = pages.size();
  if (!pages.empty()) {
    summary.page_range = std::to_string(*pages.begin()) + "-" + std::to_string(*pages.rbegin());
  }
  return summary;
}

void to_json(nlohmann::json &json_stats, const ChunkStats &stats) {
  json_stats = nlohmann::json{{"total_chunks", stats.total_chunks},
                              {"avg_chunk_size", stats.avg_chunk_size},
                              {"min_chunk_size", stats.min_chunk_size},
                              {"max_chunk_size", stats.max_chunk_size},
                              {"total_chars", stats.total_chars}};
}

void to_json(nlohmann::json &json_summary, const MetadataSummary &summary) {
  json_summary = nlohmann::json{{"total_chunks", summary.total_chunks},
                                {"regions", summary.regions},
                                {"categories", summary.categories},
                                {"unique_pages", summary.unique_pages},
                                {"page_range", summary.page_range}};
}

}  // namespace policylens_core
