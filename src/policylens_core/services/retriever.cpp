#include "policylens_core/services/retriever.hpp"

#include <utility>

#include "policylens_core/errors.hpp"

namespace policylens_core {

bool RetrievalFilter::accepts(const Chunk &chunk) const {
  if (region && chunk.region != *region) {
    return false;
  }
  if (category && chunk.category != *category) {
    return false;
  }
  return true;
}

Retriever::Retriever(std::shared_ptr<EmbeddingService> embedding_service,
                     std::shared_ptr<const VectorStore> store)
    : embedding_service_(std::move(embedding_service)), store_(std::move(store)) {
  if (!embedding_service_) {
    throw ConfigError("Retriever requires an embedding service");
  }
}

void Retriever::publish(std::shared_ptr<const VectorStore> store) {
  std::lock_guard<std::mutex> lock(store_mutex_);
  store_ = std::move(store);
}

std::shared_ptr<const VectorStore> Retriever::store() const {
  std::lock_guard<std::mutex> lock(store_mutex_);
  return store_;
}

std::vector<float> Retriever::embed_query(const std::string &query) const {
  return embedding_service_->embed_one(query);
}

std::vector<SearchResult> Retriever::retrieve(const std::string &query, int k) const {
  return retrieve(query, k, RetrievalFilter{});
}

std::vector<SearchResult> Retriever::retrieve(const std::string &query,
                                              int k,
                                              const RetrievalFilter &filter) const {
  auto store = this->store();
  if (!store || store->empty() || k <= 0) {
    return {};
  }

  std::vector<float> query_embedding = embed_query(query);
  if (filter.empty()) {
    return store->search(query_embedding, k);
  }

  // Filter the full ranking, then renumber what is left.
  std::vector<SearchResult> results;
  for (auto &hit : store->search(query_embedding, static_cast<int>(store->size()))) {
    if (!filter.accepts(hit.chunk)) {
      continue;
    }
    hit.rank = static_cast<int>(results.size());
    results.push_back(std::move(hit));
    if (results.size() == static_cast<size_t>(k)) {
      break;
    }
  }
  return results;
}

}  // namespace policylens_core
