#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "policylens_core/index/vector_store.hpp"
#include "policylens_core/services/embedding_service.hpp"
#include "policylens_core/types.hpp"

namespace policylens_core {

// Restricts hits to an exact region and/or category label. An empty filter accepts all.
struct RetrievalFilter {
  std::optional<std::string> region;
  std::optional<std::string> category;

  bool empty() const {
    return !region && !category;
  }
  bool accepts(const Chunk &chunk) const;
};

/**
 * @class Retriever
 * @brief Embeds a query and returns the nearest chunks from the published store.
 *
 * Results are ordered by ascending score (squared L2, lower is more similar) and carry
 * consecutive 0-based ranks. The store is never modified; publish() swaps in a new one for
 * later queries while in-flight queries finish on the store they started with.
 */
class Retriever {
 public:
  Retriever(std::shared_ptr<EmbeddingService> embedding_service,
            std::shared_ptr<const VectorStore> store = nullptr);

  std::vector<SearchResult> retrieve(const std::string &query, int k) const;
  std::vector<SearchResult> retrieve(const std::string &query,
                                     int k,
                                     const RetrievalFilter &filter) const;

  void publish(std::shared_ptr<const VectorStore> store);
  std::shared_ptr<const VectorStore> store() const;

 private:
  std::shared_ptr<EmbeddingService> embedding_service_;
  std::shared_ptr<const VectorStore> store_;
  mutable std::mutex store_mutex_;

  std::vector<float> embed_query(const std::string &query) const;
};

}  // namespace policylens_core
