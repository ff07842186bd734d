#include "file_reader.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lpf {

std::vector<std::string> split_tokens(const std::string& line) {
  std::stringstream ss(line);
  std::vector<std::string> tokens;
  std::string token;
  while (ss >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

std::string to_upper(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::toupper(c); });
  return str;
}

bool try_parse_double(const std::string& token, double& value) {
  if (token.empty()) {
    return false;
  }

  std::string str = token;
  std::replace(str.begin(), str.end(), 'd', 'e');
  std::replace(str.begin(), str.end(), 'D', 'E');

  char* end = nullptr;
  errno     = 0;
  value     = std::strtod(str.c_str(), &end);
  return end == str.c_str() + str.size() && errno != ERANGE;
}

bool try_parse_int(const std::string& token, int32_t& value) {
  if (token.empty()) {
    return false;
  }

  char* end = nullptr;
  errno     = 0;
  const long as_long = std::strtol(token.c_str(), &end, 10);
  if (end == token.c_str() + token.size()) {
    if (errno == ERANGE || as_long < std::numeric_limits<int32_t>::min() ||
        as_long > std::numeric_limits<int32_t>::max()) {
      return false;
    }
    value = static_cast<int32_t>(as_long);
    return true;
  }

  // Flags are sometimes written as reals by other tools
  double as_double;
  if (!try_parse_double(token, as_double) || as_double != std::trunc(as_double)) {
    return false;
  }
  if (as_double < std::numeric_limits<int32_t>::min() || as_double > std::numeric_limits<int32_t>::max()) {
    return false;
  }
  value = static_cast<int32_t>(as_double);
  return true;
}

LineReader::LineReader(std::istream& in, std::string source_name) : in_(in), source_name_(std::move(source_name)) {}

std::string LineReader::next_line() {
  std::string line;
  if (!std::getline(in_, line)) {
    fail("unexpected end of file");
  }
  line_number_++;
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

std::string LineReader::next_data_line() {
  while (true) {
    auto line = next_line();
    if (line.empty() || line[0] != '#') {
      return line;
    }
  }
}

std::vector<std::string> LineReader::next_tokens() {
  return split_tokens(next_line());
}

void LineReader::fail(const std::string& msg) const {
  throw std::runtime_error(fmt::format("{}:{}: {}", source_name_, line_number_, msg));
}

}  // namespace lpf
