#include "utilities_test.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <random>
#include <sstream>
#include <stdexcept>

#include <unistd.h>

namespace rag_tests {

std::filesystem::path TestUtilities::create_temp_test_dir() {
  static std::atomic<int> counter{0};
  auto base_dir = std::filesystem::temp_directory_path() / "rag_index_tests";

  // Generate unique directory name using pid, timestamp and a counter
  auto now = std::chrono::system_clock::now();
  auto timestamp =
      std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
  auto dir = base_dir / ("test_" + std::to_string(::getpid()) + "_" + std::to_string(timestamp) +
                         "_" + std::to_string(counter++));
  std::filesystem::create_directories(dir);
  return dir;
}

void TestUtilities::cleanup_temp_dir(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);

  // Also cleanup the parent directory if it's empty
  auto parent_dir = dir.parent_path();
  if (std::filesystem::exists(parent_dir, ec) && std::filesystem::is_empty(parent_dir, ec)) {
    std::filesystem::remove(parent_dir, ec);
  }
}

void TestUtilities::write_file(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to create test file: " + path.string());
  }
  out << contents;
}

std::string TestUtilities::read_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("Failed to open test file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

rag_core::Record TestUtilities::create_test_record(const std::vector<float>& vector,
                                                   const std::string& text) {
  rag_core::Record record;
  record.vector = vector;
  record.text = text;
  return record;
}

std::vector<float> TestUtilities::create_test_vector(const std::string& seed_text, int dimension) {
  std::mt19937 generator(static_cast<unsigned>(std::hash<std::string>{}(seed_text)));
  std::uniform_real_distribution<float> distribution(-1.0f, 1.0f);
  std::vector<float> vector(dimension);
  for (auto& component : vector) {
    component = distribution(generator);
  }
  return vector;
}

std::vector<rag_core::Record> TestUtilities::create_test_batch(int count, int dimension,
                                                               const std::string& prefix) {
  std::vector<rag_core::Record> batch;
  batch.reserve(count);
  for (int i = 0; i < count; ++i) {
    std::string text = prefix + "_" + std::to_string(i);
    batch.push_back(create_test_record(create_test_vector(text, dimension), text));
  }
  return batch;
}

std::vector<std::vector<float>> TestUtilities::reconstruct_all(const rag_core::Index& index) {
  std::vector<std::vector<float>> vectors;
  vectors.reserve(index.size());
  for (size_t i = 0; i < index.size(); ++i) {
    std::vector<float> vector(index.dimension());
    index.structure().reconstruct(static_cast<faiss::idx_t>(i), vector.data());
    vectors.push_back(std::move(vector));
  }
  return vectors;
}

}  // namespace rag_tests
