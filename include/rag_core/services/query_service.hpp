#pragma once

#include <memory>
#include <vector>

#include "rag_core/db/index_store.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

class QueryService {
 public:
  static constexpr int DEFAULT_TOP_K = 5;

  explicit QueryService(std::shared_ptr<IndexStore> index_store, bool use_file_lock = true);

  // Texts of the k nearest vectors by squared L2 distance, nearest first.
  // An empty index yields an empty result, not an error.
  QueryResult query(const std::vector<float> &query_vector, int k = DEFAULT_TOP_K);

 private:
  void validate_query(const std::vector<float> &query_vector, int k) const;

  std::shared_ptr<IndexStore> index_store_;
  bool use_file_lock_;
};

}  // namespace rag_core
