#include "rag_core/services/query_service.hpp"

#include <faiss/impl/FaissException.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "rag_core/db/store_lock.hpp"

namespace rag_core {

QueryService::QueryService(std::shared_ptr<IndexStore> index_store, bool use_file_lock)
    : index_store_(std::move(index_store)), use_file_lock_(use_file_lock) {
  if (!index_store_) {
    throw std::invalid_argument("QueryService requires an IndexStore");
  }
}

void QueryService::validate_query(const std::vector<float> &query_vector, int k) const {
  if (query_vector.empty()) {
    throw InvalidQueryError("Invalid query data: no query vector");
  }
  const size_t dimension = static_cast<size_t>(index_store_->dimension());
  if (query_vector.size() != dimension) {
    throw InvalidQueryError("Query vector dimension mismatch. Expected " +
                            std::to_string(dimension) + ", got " +
                            std::to_string(query_vector.size()));
  }
  if (k <= 0) {
    throw InvalidQueryError("k must be greater than 0, got " + std::to_string(k));
  }
}

QueryResult QueryService::query(const std::vector<float> &query_vector, int k) {
  validate_query(query_vector, k);

  std::optional<StoreLock> lock;
  if (use_file_lock_) {
    lock.emplace(index_store_->lock_path(), LockMode::Shared);
  }

  const Index index = index_store_->load();
  lock.reset();

  QueryResult result;
  if (index.empty()) {
    std::cerr << "FAISS index is empty. Ingest documents before querying." << std::endl;
    return result;
  }

  const auto actual_k =
      std::min(static_cast<faiss::idx_t>(k), static_cast<faiss::idx_t>(index.size()));
  std::vector<float> distances(actual_k);
  std::vector<faiss::idx_t> labels(actual_k);
  try {
    index.structure().search(1, query_vector.data(), actual_k, distances.data(), labels.data());
  } catch (const faiss::FaissException &e) {
    throw IndexError(std::string("Query error: ") + e.what());
  }

  const auto &metadata = index.metadata();
  result.results.reserve(actual_k);
  result.distances.reserve(actual_k);
  for (faiss::idx_t i = 0; i < actual_k; ++i) {
    const faiss::idx_t position = labels[i];
    if (position < 0 || static_cast<size_t>(position) >= metadata.size()) {
      std::cerr << "Warning: Invalid index " << position << std::endl;
      continue;
    }
    result.results.push_back(metadata[static_cast<size_t>(position)]);
    result.distances.push_back(distances[i]);
  }
  return result;
}

}  // namespace rag_core
