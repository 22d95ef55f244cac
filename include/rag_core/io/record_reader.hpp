#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "rag_core/errors.hpp"
#include "rag_core/types.hpp"

namespace rag_core {

// Decodes the JSON documents handed over by the embedding step
class RecordReader {
 public:
  /**
   * @brief Reads an ingest data file: [{"text": ..., "embedding": [...]}, ...]
   * @throws IOFailureError if the file cannot be read
   * @throws InvalidRecordError if the document is not a list of records
   */
  static std::vector<Record> read_ingest_file(const std::filesystem::path &path);

  static std::vector<Record> parse_ingest_records(const nlohmann::json &document);

  /**
   * @brief Reads a query file: {"embedding": [...]}
   * @throws IOFailureError if the file cannot be read
   * @throws InvalidQueryError if the embedding is missing or malformed
   */
  static std::vector<float> read_query_file(const std::filesystem::path &path);

  static std::vector<float> parse_query(const nlohmann::json &document);

 private:
  static std::string read_file_contents(const std::filesystem::path &path);
};

}  // namespace rag_core
