#include "rag_core/db/index_store.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace rag_core {

namespace {

std::filesystem::path temp_sibling(const std::filesystem::path &destination) {
  std::filesystem::path tmp = destination;
  tmp += ".tmp";
  return tmp;
}

void ensure_parent_directory(const std::filesystem::path &destination) {
  if (!destination.has_parent_path()) {
    return;
  }
  std::error_code ec;
  std::filesystem::create_directories(destination.parent_path(), ec);
  if (ec) {
    throw IOFailureError("Failed to create directory " + destination.parent_path().string() +
                         ": " + ec.message());
  }
}

void discard_file(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    std::cerr << "Warning: could not remove " << path.string() << ": " << ec.message()
              << std::endl;
  }
}

bool path_exists(const std::filesystem::path &path) {
  std::error_code ec;
  bool found = std::filesystem::exists(path, ec);
  if (ec) {
    throw IOFailureError("Failed to stat " + path.string() + ": " + ec.message());
  }
  return found;
}

}  // namespace

Index::Index(std::unique_ptr<faiss::Index> structure,
             std::vector<std::string> metadata,
             LoadReport report)
    : structure_(std::move(structure)), metadata_(std::move(metadata)), report_(report) {
  if (!structure_) {
    throw std::invalid_argument("Index requires a vector structure");
  }
}

size_t Index::size() const {
  return static_cast<size_t>(structure_->ntotal);
}

int Index::dimension() const {
  return structure_->d;
}

IndexStore::IndexStore(StoreOptions options) : options_(std::move(options)) {
  validate_options();
}

void IndexStore::validate_options() const {
  if (options_.dimension <= 0) {
    throw std::invalid_argument("Vector dimension must be greater than 0, got " +
                                std::to_string(options_.dimension));
  }
  if (options_.index_path.empty()) {
    throw std::invalid_argument("index_path cannot be empty");
  }
  if (options_.metadata_path.empty()) {
    throw std::invalid_argument("metadata_path cannot be empty");
  }
}

std::filesystem::path IndexStore::lock_path() const {
  std::filesystem::path path = options_.index_path;
  path += ".lock";
  return path;
}

Index IndexStore::create_empty() const {
  return Index(std::make_unique<faiss::IndexFlatL2>(options_.dimension), {});
}

Index IndexStore::load() const {
  LoadReport report;
  auto structure = load_structure(report);
  auto metadata = load_metadata(report);

  report.structure_size = static_cast<size_t>(structure->ntotal);
  report.metadata_size = metadata.size();
  if (!report.aligned()) {
    std::cerr << "Warning: index holds " << report.structure_size << " vectors but metadata has "
              << report.metadata_size << " entries. Results past the shorter of the two are skipped."
              << std::endl;
  }

  return Index(std::move(structure), std::move(metadata), report);
}

std::unique_ptr<faiss::Index> IndexStore::load_structure(LoadReport &report) const {
  if (!path_exists(options_.index_path)) {
    std::cerr << "Creating new FAISS index (dimension " << options_.dimension << ")" << std::endl;
    return std::make_unique<faiss::IndexFlatL2>(options_.dimension);
  }

  report.index_file_found = true;
  std::cerr << "Loading existing index from " << options_.index_path.string() << std::endl;

  std::unique_ptr<faiss::Index> structure;
  try {
    structure.reset(faiss::read_index(options_.index_path.c_str()));
  } catch (const faiss::FaissException &e) {
    throw IOFailureError("Failed to read index " + options_.index_path.string() + ": " + e.what());
  }

  if (structure->d != options_.dimension) {
    throw DimensionMismatchError("Persisted index " + options_.index_path.string() +
                                 " has dimension " + std::to_string(structure->d) +
                                 ", expected " + std::to_string(options_.dimension));
  }
  if (structure->metric_type != faiss::METRIC_L2) {
    throw IOFailureError("Persisted index " + options_.index_path.string() +
                         " does not use L2 distance");
  }
  return structure;
}

std::vector<std::string> IndexStore::load_metadata(LoadReport &report) const {
  const auto &path = options_.metadata_path;
  if (!path_exists(path)) {
    std::cerr << "No metadata found - initializing empty list" << std::endl;
    return {};
  }

  report.metadata_file_found = true;
  std::cerr << "Loading metadata from " << path.string() << std::endl;

  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    throw IOFailureError("Failed to open metadata file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw IOFailureError("Failed to read metadata file: " + path.string());
  }

  auto corrupt = [&](const std::string &reason) {
    std::cerr << "Warning: " << path.string() << " is empty or corrupted (" << reason
              << "). Initializing new metadata." << std::endl;
    report.metadata_corrupt = true;
    return std::vector<std::string>{};
  };

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(buffer.str());
  } catch (const nlohmann::json::parse_error &e) {
    return corrupt(e.what());
  }

  if (!parsed.is_array()) {
    return corrupt("expected a JSON array");
  }

  std::vector<std::string> metadata;
  metadata.reserve(parsed.size());
  for (const auto &entry : parsed) {
    if (!entry.is_string()) {
      return corrupt("metadata entries must be strings");
    }
    metadata.push_back(entry.get<std::string>());
  }
  return metadata;
}

void IndexStore::save(const Index &index) const {
  if (index.dimension() != options_.dimension) {
    throw DimensionMismatchError("Cannot save index of dimension " +
                                 std::to_string(index.dimension()) + " to a store of dimension " +
                                 std::to_string(options_.dimension));
  }

  // Serialize before touching the disk so an unencodable text leaves both files untouched
  std::string serialized;
  try {
    serialized = nlohmann::json(index.metadata()).dump();
  } catch (const nlohmann::json::type_error &e) {
    throw IOFailureError(std::string("Failed to encode metadata: ") + e.what());
  }

  ensure_parent_directory(options_.index_path);
  ensure_parent_directory(options_.metadata_path);
  const auto index_tmp = temp_sibling(options_.index_path);
  const auto metadata_tmp = temp_sibling(options_.metadata_path);

  // Both artifacts are fully written before either destination is touched
  try {
    stage_structure(index.structure(), index_tmp);
    stage_metadata(serialized, metadata_tmp);
  } catch (const IOFailureError &) {
    discard_file(index_tmp);
    discard_file(metadata_tmp);
    throw;
  }

  commit(index_tmp, metadata_tmp);
}

void IndexStore::stage_structure(const faiss::Index &structure,
                                 const std::filesystem::path &tmp) const {
  try {
    faiss::write_index(&structure, tmp.c_str());
  } catch (const faiss::FaissException &e) {
    throw IOFailureError("Failed to write index " + tmp.string() + ": " + e.what());
  }
}

void IndexStore::stage_metadata(const std::string &serialized,
                                const std::filesystem::path &tmp) const {
  std::ofstream out(tmp, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw IOFailureError("Failed to open metadata file for writing: " + tmp.string());
  }
  out << serialized;
  out.flush();
  if (!out) {
    throw IOFailureError("Failed to write metadata file: " + tmp.string());
  }
}

/*
Renames the staged structure, then the staged metadata, over their
destinations. The previous structure is kept under <index_path>.bak until the
metadata rename succeeds, so a rename failure restores it and the store is left
as it was. Only a crash between the two renames leaves the structure ahead of
the metadata.
*/
void IndexStore::commit(const std::filesystem::path &index_tmp,
                        const std::filesystem::path &metadata_tmp) const {
  const auto &index_path = options_.index_path;
  const auto &metadata_path = options_.metadata_path;
  std::filesystem::path backup = index_path;
  backup += ".bak";

  auto abort_commit = [&](const std::string &message) {
    discard_file(index_tmp);
    discard_file(metadata_tmp);
    throw IOFailureError(message);
  };

  std::error_code ec;
  bool had_structure = std::filesystem::exists(index_path, ec);
  if (ec) {
    abort_commit("Failed to stat " + index_path.string() + ": " + ec.message());
  }

  if (had_structure) {
    std::filesystem::remove(backup, ec);
    std::filesystem::create_hard_link(index_path, backup, ec);
    if (ec) {
      std::filesystem::copy_file(index_path, backup,
                                 std::filesystem::copy_options::overwrite_existing, ec);
    }
    if (ec) {
      abort_commit("Failed to back up " + index_path.string() + ": " + ec.message());
    }
  }

  std::filesystem::rename(index_tmp, index_path, ec);
  if (ec) {
    if (had_structure) {
      discard_file(backup);
    }
    abort_commit("Failed to move " + index_tmp.string() + " to " + index_path.string() + ": " +
                 ec.message());
  }

  std::filesystem::rename(metadata_tmp, metadata_path, ec);
  if (ec) {
    const std::string reason = ec.message();
    discard_file(metadata_tmp);

    std::error_code restore_ec;
    if (had_structure) {
      std::filesystem::rename(backup, index_path, restore_ec);
    } else {
      std::filesystem::remove(index_path, restore_ec);
    }
    if (restore_ec) {
      std::cerr << "Warning: could not restore " << index_path.string() << ": "
                << restore_ec.message() << std::endl;
    }
    throw IOFailureError("Failed to move " + metadata_tmp.string() + " to " +
                         metadata_path.string() + ": " + reason);
  }

  if (had_structure) {
    discard_file(backup);
  }
}

size_t IndexStore::repair_alignment(Index &index) const {
  const size_t structure_size = index.size();
  const size_t metadata_size = index.metadata().size();
  if (structure_size == metadata_size) {
    return 0;
  }

  if (structure_size > metadata_size) {
    faiss::IDSelectorRange orphans(static_cast<faiss::idx_t>(metadata_size),
                                   static_cast<faiss::idx_t>(structure_size));
    size_t removed = 0;
    try {
      removed = index.structure().remove_ids(orphans);
    } catch (const faiss::FaissException &e) {
      throw IndexError(std::string("Failed to drop orphan vectors: ") + e.what());
    }
    std::cerr << "Warning: dropped " << removed << " vectors with no metadata" << std::endl;
    return removed;
  }

  index.metadata().resize(structure_size);
  const size_t dropped = metadata_size - structure_size;
  std::cerr << "Warning: dropped " << dropped << " metadata entries with no vector" << std::endl;
  return dropped;
}

}  // namespace rag_core
