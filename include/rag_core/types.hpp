#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace rag_core {

struct Record {
  std::vector<float> vector;
  std::string text;
};

struct IngestResult {
  size_t ingested_count = 0;
};

struct QueryResult {
  // Texts of the nearest neighbours, nearest first
  std::vector<std::string> results;
  // Squared L2 distance of each entry in results
  std::vector<float> distances;
};

}  // namespace rag_core
