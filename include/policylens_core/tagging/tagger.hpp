#pragma once

#include <optional>
#include <string>
#include <vector>

#include "policylens_core/tagging/label_table.hpp"
#include "policylens_core/types/chunk.hpp"
#include "policylens_core/types/page.hpp"

namespace policylens_core {

// Labels forced for a whole ingestion run instead of being derived from the source name.
struct TaggingOverrides {
  std::optional<std::string> region;
  std::optional<std::string> category;
};

/**
 * @class Tagger
 * @brief Turns the segments of one page into Chunk records with provenance.
 *
 * Region and category are looked up in the label tables using the page's source_id.
 * Chunk ids are a pure function of (source_id, page_number, chunk_index), so tagging the
 * same input twice yields the same ids.
 */
class Tagger {
 public:
  Tagger();
  Tagger(LabelTable region_table, LabelTable category_table);

  // Throws ParseInputError when the page context is invalid.
  std::vector<Chunk> tag(const std::vector<std::string> &segments,
                         const Page &page,
                         const TaggingOverrides &overrides = {}) const;

  std::string region_for(const std::string &source_id) const;
  std::string category_for(const std::string &source_id) const;

  static std::string make_chunk_id(const std::string &source_id, int page_number, int chunk_index);

 private:
  LabelTable region_table_;
  LabelTable category_table_;

  static constexpr size_t CHUNK_ID_PREFIX_LENGTH = 20;
};

}  // namespace policylens_core
