#include "rag_core/services/ingest_service.hpp"

#include <faiss/impl/FaissException.h>

#include <optional>
#include <stdexcept>
#include <string>

#include "rag_core/db/store_lock.hpp"

namespace rag_core {

IngestService::IngestService(std::shared_ptr<IndexStore> index_store, bool use_file_lock)
    : index_store_(std::move(index_store)), use_file_lock_(use_file_lock) {
  if (!index_store_) {
    throw std::invalid_argument("IngestService requires an IndexStore");
  }
}

void IngestService::validate_batch(const std::vector<Record> &records) const {
  if (records.empty()) {
    throw EmptyBatchError("No data to ingest: the batch is empty");
  }

  const size_t dimension = static_cast<size_t>(index_store_->dimension());
  for (size_t i = 0; i < records.size(); ++i) {
    if (records[i].vector.size() != dimension) {
      throw DimensionMismatchError("Vector dimension mismatch in record " + std::to_string(i) +
                                   ". Expected " + std::to_string(dimension) + ", got " +
                                   std::to_string(records[i].vector.size()));
    }
  }
}

IngestResult IngestService::ingest(const std::vector<Record> &records) {
  validate_batch(records);

  std::optional<StoreLock> lock;
  if (use_file_lock_) {
    lock.emplace(index_store_->lock_path(), LockMode::Exclusive);
  }

  Index index = index_store_->load();
  index_store_->repair_alignment(index);
  const size_t initial_size = index.size();

  const size_t dimension = static_cast<size_t>(index_store_->dimension());
  std::vector<float> flat_vectors;
  flat_vectors.reserve(records.size() * dimension);
  for (const auto &record : records) {
    flat_vectors.insert(flat_vectors.end(), record.vector.begin(), record.vector.end());
  }

  try {
    index.structure().add(static_cast<faiss::idx_t>(records.size()), flat_vectors.data());
  } catch (const faiss::FaissException &e) {
    throw IndexError(std::string("Ingestion error: ") + e.what());
  }

  auto &metadata = index.metadata();
  metadata.reserve(metadata.size() + records.size());
  for (const auto &record : records) {
    metadata.push_back(record.text);
  }

  index_store_->save(index);

  IngestResult result;
  result.ingested_count = index.size() - initial_size;
  return result;
}

}  // namespace rag_core
