#pragma once

#include "layer_array.hpp"

#include <fmt/core.h>
#include <richdem/common/Array2D.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

template <class T>
bool ArrayValuesEqual(const richdem::Array2D<T>& a, const richdem::Array2D<T>& b) {
  if (a.width() != b.width() || a.height() != b.height()) {
    return false;
  }
  for (auto i = a.i0(); i < a.size(); i++) {
    if (a(i) != b(i))
      return false;
  }
  return true;
}

template <class T>
bool LayersEqual(const std::vector<lpf::LayerArray<T>>& a, const std::vector<lpf::LayerArray<T>>& b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t k = 0; k < a.size(); k++) {
    if (a[k].name() != b[k].name() || !ArrayValuesEqual(a[k].array(), b[k].array()))
      return false;
  }
  return true;
}

inline size_t CountOccurrences(const std::string& haystack, const std::string& needle) {
  size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1)) {
    count++;
  }
  return count;
}

/// Scratch directory that is removed again when the test finishes
class TempDir {
 public:
  TempDir() {
    static int counter = 0;
    const auto stamp   = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() / fmt::format("lpf_test_{}_{}", stamp, counter++);
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  TempDir(const TempDir&)            = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

  void write(const std::string& filename, const std::string& contents) const {
    std::ofstream fout(path_ / filename);
    fout << contents;
  }

  std::string read(const std::string& filename) const {
    std::ifstream fin(path_ / filename);
    return std::string(std::istreambuf_iterator<char>(fin), std::istreambuf_iterator<char>());
  }

 private:
  std::filesystem::path path_;
};
