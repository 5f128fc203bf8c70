#include "policylens_core/tagging/tagger.hpp"

#include <cctype>
#include <filesystem>
#include <iostream>
#include <utility>

namespace policylens_core {

namespace {

void erase_all(std::string &text, const std::string &needle) {
  size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.erase(pos, needle.size());
  }
}

// Labels and ids come from the file name only; directories in a path-shaped
// source_id must not leak into either.
std::string file_name_of(const std::string &source_id) {
  std::string name = std::filesystem::path(source_id).filename().string();
  return name.empty() ? source_id : name;
}

bool is_id_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
}

}  // namespace

Tagger::Tagger()
    : region_table_(LabelTable::us_state_regions()),
      category_table_(LabelTable::document_categories()) {}

Tagger::Tagger(LabelTable region_table, LabelTable category_table)
    : region_table_(std::move(region_table)), category_table_(std::move(category_table)) {}

std::string Tagger::region_for(const std::string &source_id) const {
  return region_table_.classify(file_name_of(source_id));
}

std::string Tagger::category_for(const std::string &source_id) const {
  return category_table_.classify(file_name_of(source_id));
}

std::string Tagger::make_chunk_id(const std::string &source_id, int page_number, int chunk_index) {
  std::string prefix = file_name_of(source_id);
  erase_all(prefix, ".pdf");
  erase_all(prefix, ".PDF");
  if (prefix.size() > CHUNK_ID_PREFIX_LENGTH) {
    prefix.resize(CHUNK_ID_PREFIX_LENGTH);
  }
  for (auto &c : prefix) {
    if (!is_id_char(c)) {
      c = '-';
    }
  }
  return prefix + "-p" + std::to_string(page_number) + "-c" + std::to_string(chunk_index);
}

std::vector<Chunk> Tagger::tag(const std::vector<std::string> &segments,
                               const Page &page,
                               const TaggingOverrides &overrides) const {
  validate_page(page);

  std::string region = overrides.region ? *overrides.region : region_for(page.source_id);
  std::string category = overrides.category ? *overrides.category : category_for(page.source_id);
  if (!segments.empty()) {
    if (region == region_table_.fallback()) {
      std::cerr << "Warning: no region matched for '" << page.source_id << "'" << std::endl;
    }
    if (category == category_table_.fallback()) {
      std::cerr << "Warning: no category matched for '" << page.source_id << "'" << std::endl;
    }
  }

  std::vector<Chunk> chunks;
  chunks.reserve(segments.size());
  for (size_t i = 0; i < segments.size(); ++i) {
    Chunk chunk;
    chunk.text = segments[i];
    chunk.source_id = page.source_id;
    chunk.page_number = page.page_number;
    chunk.chunk_index = static_cast<int>(i);
    chunk.chunk_id = make_chunk_id(page.source_id, page.page_number, chunk.chunk_index);
    chunk.region = region;
    chunk.category = category;
    chunks.push_back(std::move(chunk));
  }
  return chunks;
}

}  // namespace policylens_core
