#pragma once

#include <memory>
#include <vector>

#include "rag_core/db/index_store.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

class IngestService {
 public:
  explicit IngestService(std::shared_ptr<IndexStore> index_store, bool use_file_lock = true);

  // Appends the batch in order and persists the index. The batch is all-or-nothing:
  // an empty batch or any vector of the wrong length is rejected before the store is touched.
  IngestResult ingest(const std::vector<Record> &records);

 private:
  void validate_batch(const std::vector<Record> &records) const;

  std::shared_ptr<IndexStore> index_store_;
  bool use_file_lock_;
};

}  // namespace rag_core
