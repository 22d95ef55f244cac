#pragma once
#include <faiss/Index.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "rag_core/errors.hpp"

namespace rag_core {

struct StoreOptions {
  static constexpr int DEFAULT_DIMENSION = 1536;

  std::filesystem::path index_path = "faiss.index";
  std::filesystem::path metadata_path = "faiss_metadata.json";
  int dimension = DEFAULT_DIMENSION;
};

// What load() found on disk. Recoverable conditions are recorded here instead of thrown.
struct LoadReport {
  bool index_file_found = false;
  bool metadata_file_found = false;
  bool metadata_corrupt = false;
  size_t structure_size = 0;
  size_t metadata_size = 0;

  bool aligned() const {
    return structure_size == metadata_size;
  }
};

/*
The searchable vector structure together with the texts it was built from.
Position i in the structure belongs to metadata()[i]; there is no other key.
*/
class Index {
 public:
  Index(std::unique_ptr<faiss::Index> structure,
        std::vector<std::string> metadata,
        LoadReport report = {});

  Index(Index &&) noexcept = default;
  Index &operator=(Index &&) noexcept = default;
  Index(const Index &) = delete;
  Index &operator=(const Index &) = delete;

  faiss::Index &structure() {
    return *structure_;
  }
  const faiss::Index &structure() const {
    return *structure_;
  }

  std::vector<std::string> &metadata() {
    return metadata_;
  }
  const std::vector<std::string> &metadata() const {
    return metadata_;
  }

  size_t size() const;
  int dimension() const;
  bool empty() const {
    return size() == 0;
  }

  const LoadReport &load_report() const {
    return report_;
  }

 private:
  std::unique_ptr<faiss::Index> structure_;
  std::vector<std::string> metadata_;
  LoadReport report_;
};

class IndexStore {
 public:
  explicit IndexStore(StoreOptions options);

  // Disable copy constructor and assignment
  IndexStore(const IndexStore &) = delete;
  IndexStore &operator=(const IndexStore &) = delete;

  // Load the persisted index, or an empty one if nothing was saved yet
  Index load() const;

  Index create_empty() const;

  // Writes both artifacts to temporaries, then renames the structure first and
  // the metadata second. Throws IOFailureError with the store unchanged.
  void save(const Index &index) const;

  // Drops orphan vectors or surplus texts left behind by an interrupted save.
  // Returns how many positions were discarded.
  size_t repair_alignment(Index &index) const;

  int dimension() const {
    return options_.dimension;
  }
  const std::filesystem::path &index_path() const {
    return options_.index_path;
  }
  const std::filesystem::path &metadata_path() const {
    return options_.metadata_path;
  }
  std::filesystem::path lock_path() const;

 private:
  StoreOptions options_;

  std::unique_ptr<faiss::Index> load_structure(LoadReport &report) const;
  std::vector<std::string> load_metadata(LoadReport &report) const;
  void stage_structure(const faiss::Index &structure, const std::filesystem::path &tmp) const;
  void stage_metadata(const std::string &serialized, const std::filesystem::path &tmp) const;
  void commit(const std::filesystem::path &index_tmp,
              const std::filesystem::path &metadata_tmp) const;
  void validate_options() const;
};

}  // namespace rag_core
