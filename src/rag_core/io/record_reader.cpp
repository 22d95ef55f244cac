#include "rag_core/io/record_reader.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace rag_core {

namespace {

// False if value is not a non-empty array of numbers that fit in a float
bool to_float_vector(const nlohmann::json &value, std::vector<float> &out) {
  if (!value.is_array() || value.empty()) {
    return false;
  }
  out.clear();
  out.reserve(value.size());
  for (const auto &component : value) {
    if (!component.is_number()) {
      return false;
    }
    const double number = component.get<double>();
    if (!std::isfinite(number) || std::abs(number) > std::numeric_limits<float>::max()) {
      return false;
    }
    out.push_back(static_cast<float>(number));
  }
  return true;
}

}  // namespace

std::string RecordReader::read_file_contents(const std::filesystem::path &path) {
  std::ifstream file_stream(path);
  if (!file_stream.is_open()) {
    throw IOFailureError("Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  if (file_stream.bad()) {
    throw IOFailureError("Failed to read file: " + path.string());
  }
  return buffer.str();
}

std::vector<Record> RecordReader::read_ingest_file(const std::filesystem::path &path) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(read_file_contents(path));
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidRecordError("Failed to parse JSON in data file '" + path.string() + "': " +
                             e.what());
  }
  return parse_ingest_records(document);
}

std::vector<Record> RecordReader::parse_ingest_records(const nlohmann::json &document) {
  if (!document.is_array()) {
    throw InvalidRecordError("Ingest data must be a JSON array of records");
  }

  std::vector<Record> records;
  records.reserve(document.size());
  for (size_t i = 0; i < document.size(); ++i) {
    const auto &item = document[i];
    if (!item.is_object()) {
      throw InvalidRecordError("Record " + std::to_string(i) + " is not a JSON object");
    }

    auto text_it = item.find("text");
    if (text_it == item.end() || !text_it->is_string()) {
      throw InvalidRecordError("Record " + std::to_string(i) + " has no string 'text' field");
    }

    auto embedding_it = item.find("embedding");
    Record record;
    if (embedding_it == item.end() || !to_float_vector(*embedding_it, record.vector)) {
      throw InvalidRecordError("Record " + std::to_string(i) +
                               " has no numeric 'embedding' array within float range");
    }
    record.text = text_it->get<std::string>();
    records.push_back(std::move(record));
  }
  return records;
}

std::vector<float> RecordReader::read_query_file(const std::filesystem::path &path) {
  nlohmann::json document;
  try {
    document = nlohmann::json::parse(read_file_contents(path));
  } catch (const nlohmann::json::parse_error &e) {
    throw InvalidQueryError("Failed to parse JSON in query file '" + path.string() + "': " +
                            e.what());
  }
  return parse_query(document);
}

std::vector<float> RecordReader::parse_query(const nlohmann::json &document) {
  if (!document.is_object() || !document.contains("embedding")) {
    throw InvalidQueryError("Invalid query data: missing 'embedding' field");
  }
  std::vector<float> vector;
  if (!to_float_vector(document.at("embedding"), vector)) {
    throw InvalidQueryError("Invalid query data: 'embedding' must be a non-empty array of numbers within float range");
  }
  return vector;
}

}  // namespace rag_core
