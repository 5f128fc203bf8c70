#include "policylens_core/index/vector_store.hpp"

#include <faiss/impl/FaissException.h>
#include <faiss/index_io.h>
#include <openssl/evp.h>

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "policylens_core/errors.hpp"

namespace policylens_core {

namespace {

std::filesystem::path temporary_path(const std::filesystem::path &path) {
  return path.string() + ".tmp";
}

std::string sha256_of_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw CorruptStore("Failed to open " + path.string() + " for hashing");
  }

  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw CorruptStore("Failed to create EVP context for hashing");
  }
  if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw CorruptStore("Failed to initialize SHA256 digest");
  }

  std::vector<char> buffer(64 * 1024);
  while (file) {
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = file.gcount();
    if (read > 0 && EVP_DigestUpdate(mdctx, buffer.data(), static_cast<size_t>(read)) != 1) {
      EVP_MD_CTX_free(mdctx);
      throw CorruptStore("Failed to update SHA256 digest");
    }
  }
  if (file.bad()) {
    EVP_MD_CTX_free(mdctx);
    throw CorruptStore("Failed to read " + path.string() + " for hashing");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw CorruptStore("Failed to finalize SHA256 digest");
  }
  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

void write_json_file(const std::filesystem::path &path, const nlohmann::json &json) {
  std::ofstream file(path);
  if (!file) {
    throw CorruptStore("Failed to open " + path.string() + " for writing");
  }
  file << json.dump(2);
  file.flush();
  if (!file) {
    throw CorruptStore("Failed to write " + path.string());
  }
}

nlohmann::json read_json_file(const std::filesystem::path &path) {
  std::ifstream file(path);
  if (!file) {
    throw CorruptStore("Failed to open " + path.string());
  }
  try {
    return nlohmann::json::parse(file);
  } catch (const nlohmann::json::exception &e) {
    throw CorruptStore("Failed to parse " + path.string() + ": " + e.what());
  }
}

void rename_into_place(const std::filesystem::path &from, const std::filesystem::path &to) {
  std::error_code ec;
  std::filesystem::rename(from, to, ec);
  if (ec) {
    throw CorruptStore("Failed to move " + from.string() + " to " + to.string() + ": " +
                       ec.message());
  }
}

}  // namespace

VectorStore::VectorStore(size_t dimension)
    : dimension_(dimension), index_(nullptr) {
  if (dimension_ == 0) {
    throw ConfigError("Vector store dimension must be positive");
  }
  index_ = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension_));
}

VectorStore::~VectorStore() = default;

void VectorStore::validate_vector_dimension(const std::vector<float> &vector,
                                            const std::string &context) const {
  if (vector.size() != dimension_) {
    throw DimensionMismatch(context + " dimension mismatch. Expected " +
                            std::to_string(dimension_) + ", got " +
                            std::to_string(vector.size()));
  }
}

void VectorStore::build(const std::vector<std::vector<float>> &vectors,
                        const std::vector<Chunk> &metadata) {
  if (vectors.size() != metadata.size()) {
    throw DimensionMismatch("Cannot build vector store from " + std::to_string(vectors.size()) +
                            " vectors and " + std::to_string(metadata.size()) +
                            " metadata records");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(vectors.size() * dimension_);
  for (size_t i = 0; i < vectors.size(); ++i) {
    validate_vector_dimension(vectors[i], "Vector " + std::to_string(i));
    all_vectors_flat.insert(all_vectors_flat.end(), vectors[i].begin(), vectors[i].end());
  }

  auto fresh_index = std::make_unique<faiss::IndexFlatL2>(static_cast<faiss::idx_t>(dimension_));
  if (!vectors.empty()) {
    fresh_index->add(static_cast<faiss::idx_t>(vectors.size()), all_vectors_flat.data());
  }
  std::vector<Chunk> fresh_metadata = metadata;

  index_ = std::move(fresh_index);
  metadata_ = std::move(fresh_metadata);
  std::cout << "Built vector store with " << metadata_.size() << " vectors of dimension "
            << dimension_ << std::endl;
}

void VectorStore::build(const std::vector<EmbeddedChunk> &embedded_chunks) {
  std::vector<std::vector<float>> vectors;
  std::vector<Chunk> metadata;
  vectors.reserve(embedded_chunks.size());
  metadata.reserve(embedded_chunks.size());
  for (const auto &embedded : embedded_chunks) {
    vectors.push_back(embedded.embedding);
    metadata.push_back(embedded.chunk);
  }
  build(vectors, metadata);
}

void VectorStore::save(const std::filesystem::path &directory) const {
  std::error_code ec;
  std::filesystem::create_directories(directory, ec);
  if (ec) {
    throw CorruptStore("Failed to create store directory " + directory.string() + ": " +
                       ec.message());
  }
  const auto index_path = directory / INDEX_FILE_NAME;
  const auto metadata_path = directory / METADATA_FILE_NAME;
  const auto manifest_path = directory / MANIFEST_FILE_NAME;

  try {
    faiss::write_index(index_.get(), temporary_path(index_path).c_str());
  } catch (const faiss::FaissException &e) {
    throw CorruptStore("Failed to write index to " + index_path.string() + ": " + e.what());
  }
  nlohmann::json json_metadata = metadata_;
  write_json_file(temporary_path(metadata_path), json_metadata);

  nlohmann::json manifest;
  manifest["vector_count"] = metadata_.size();
  manifest["dimension"] = dimension_;
  manifest["index_sha256"] = sha256_of_file(temporary_path(index_path));
  manifest["metadata_sha256"] = sha256_of_file(temporary_path(metadata_path));
  write_json_file(temporary_path(manifest_path), manifest);

  // The manifest goes last: until it is renamed, load() rejects the
  // half-replaced artifacts because their checksums do not match.
  rename_into_place(temporary_path(index_path), index_path);
  rename_into_place(temporary_path(metadata_path), metadata_path);
  rename_into_place(temporary_path(manifest_path), manifest_path);
  std::cout << "Saved vector store (" << metadata_.size() << " vectors) to " << directory
            << std::endl;
}

bool VectorStore::exists(const std::filesystem::path &directory) {
  return std::filesystem::exists(directory / INDEX_FILE_NAME) &&
         std::filesystem::exists(directory / METADATA_FILE_NAME) &&
         std::filesystem::exists(directory / MANIFEST_FILE_NAME);
}

void VectorStore::load(const std::filesystem::path &directory) {
  const auto index_path = directory / INDEX_FILE_NAME;
  const auto metadata_path = directory / METADATA_FILE_NAME;
  const auto manifest_path = directory / MANIFEST_FILE_NAME;
  for (const auto &path : {manifest_path, index_path, metadata_path}) {
    if (!std::filesystem::exists(path)) {
      throw CorruptStore("Store file not found: " + path.string());
    }
  }

  size_t manifest_count = 0;
  size_t manifest_dimension = 0;
  std::string index_sha256;
  std::string metadata_sha256;
  try {
    nlohmann::json manifest = read_json_file(manifest_path);
    manifest_count = manifest.at("vector_count").get<size_t>();
    manifest_dimension = manifest.at("dimension").get<size_t>();
    index_sha256 = manifest.at("index_sha256").get<std::string>();
    metadata_sha256 = manifest.at("metadata_sha256").get<std::string>();
  } catch (const nlohmann::json::exception &e) {
    throw CorruptStore("Invalid manifest " + manifest_path.string() + ": " + e.what());
  }

  if (sha256_of_file(index_path) != index_sha256) {
    throw CorruptStore("Index " + index_path.string() + " does not match the manifest in " +
                       directory.string());
  }
  if (sha256_of_file(metadata_path) != metadata_sha256) {
    throw CorruptStore("Metadata " + metadata_path.string() +
                       " does not match the manifest in " + directory.string());
  }
  if (manifest_dimension != dimension_) {
    throw DimensionMismatch("Stored index has dimension " + std::to_string(manifest_dimension) +
                            ", expected " + std::to_string(dimension_));
  }

  std::unique_ptr<faiss::IndexFlatL2> loaded_index;
  try {
    std::unique_ptr<faiss::Index> raw_index(faiss::read_index(index_path.c_str()));
    auto *flat_index = dynamic_cast<faiss::IndexFlatL2 *>(raw_index.get());
    if (!flat_index) {
      throw CorruptStore("Index at " + index_path.string() + " is not an exact L2 index");
    }
    raw_index.release();
    loaded_index.reset(flat_index);
  } catch (const faiss::FaissException &e) {
    throw CorruptStore("Failed to read index " + index_path.string() + ": " + e.what());
  }

  if (static_cast<size_t>(loaded_index->d) != dimension_) {
    throw DimensionMismatch("Stored index has dimension " + std::to_string(loaded_index->d) +
                            ", expected " + std::to_string(dimension_));
  }

  std::vector<Chunk> loaded_metadata;
  try {
    nlohmann::json json_metadata = read_json_file(metadata_path);
    if (!json_metadata.is_array()) {
      throw CorruptStore("Metadata in " + metadata_path.string() + " is not an array");
    }
    loaded_metadata = json_metadata.get<std::vector<Chunk>>();
  } catch (const nlohmann::json::exception &e) {
    throw CorruptStore("Failed to parse metadata " + metadata_path.string() + ": " + e.what());
  }

  if (static_cast<size_t>(loaded_index->ntotal) != loaded_metadata.size() ||
      loaded_metadata.size() != manifest_count) {
    throw CorruptStore("Vector count (" + std::to_string(loaded_index->ntotal) +
                       "), metadata count (" + std::to_string(loaded_metadata.size()) +
                       ") and manifest count (" + std::to_string(manifest_count) +
                       ") disagree in " + directory.string());
  }

  index_ = std::move(loaded_index);
  metadata_ = std::move(loaded_metadata);
  std::cout << "Loaded vector store (" << metadata_.size() << " vectors) from " << directory
            << std::endl;
}

const Chunk &VectorStore::metadata_at(size_t position) const {
  if (position >= metadata_.size()) {
    throw std::out_of_range("Metadata position " + std::to_string(position) + " out of range (" +
                            std::to_string(metadata_.size()) + " entries)");
  }
  return metadata_[position];
}

std::vector<SearchResult> VectorStore::search(const std::vector<float> &query_vector, int k) const {
  validate_vector_dimension(query_vector, "Query vector");
  if (k <= 0 || empty()) {
    return {};
  }

  // Rank the whole corpus so ties can be ordered by position; faiss does not
  // guarantee a tie order.
  const faiss::idx_t total = index_->ntotal;
  std::vector<float> distances(total);
  std::vector<faiss::idx_t> labels(total);
  index_->search(1, query_vector.data(), total, distances.data(), labels.data());

  std::vector<std::pair<float, faiss::idx_t>> ranked;
  ranked.reserve(total);
  for (faiss::idx_t i = 0; i < total; ++i) {
    if (labels[i] >= 0) {
      ranked.emplace_back(distances[i], labels[i]);
    }
  }
  std::sort(ranked.begin(), ranked.end());

  size_t count = std::min(static_cast<size_t>(k), ranked.size());
  std::vector<SearchResult> results;
  results.reserve(count);
  for (size_t i = 0; i < count; ++i) {
    SearchResult result;
    result.chunk = metadata_[static_cast<size_t>(ranked[i].second)];
    result.score = ranked[i].first;
    result.rank = static_cast<int>(i);
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace policylens_core
