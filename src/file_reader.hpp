#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <type_traits>
#include <vector>

namespace lpf {

std::vector<std::string> split_tokens(const std::string& line);

std::string to_lower(std::string str);
std::string to_upper(std::string str);

// Number parsing for package files. Both return false rather than throwing so
// the caller can report the offending line. Fortran 'D' exponents are accepted,
// and integers may be written as reals ("1.0") as long as they are integral.
bool try_parse_double(const std::string& token, double& value);
bool try_parse_int(const std::string& token, int32_t& value);

/// Reads a package file one line at a time and keeps count of where it is, so
/// that a structural error can name the line at which the file stopped
/// matching the expected layout.
class LineReader {
 public:
  LineReader(std::istream& in, std::string source_name);

  std::string next_line();
  std::string next_data_line();  // skips lines starting with '#'
  std::vector<std::string> next_tokens();

  /// Collect whitespace separated values across as many lines as it takes to
  /// gather `count` of them. Anything left over on the last line is ignored.
  template <class T>
  std::vector<T> read_values(const size_t count);

  template <class T>
  T parse(const std::string& token) const;

  [[noreturn]] void fail(const std::string& msg) const;

  const std::string& source_name() const { return source_name_; }
  int64_t line_number() const { return line_number_; }

 private:
  std::istream& in_;
  std::string source_name_;
  int64_t line_number_ = 0;
};

template <class T>
T LineReader::parse(const std::string& token) const {
  if constexpr (std::is_integral_v<T>) {
    int32_t value;
    if (!try_parse_int(token, value)) {
      fail("expected an integer but found '" + token + "'");
    }
    return static_cast<T>(value);
  } else {
    double value;
    if (!try_parse_double(token, value)) {
      fail("expected a number but found '" + token + "'");
    }
    return static_cast<T>(value);
  }
}

template <class T>
std::vector<T> LineReader::read_values(const size_t count) {
  std::vector<T> values;
  values.reserve(count);
  while (values.size() < count) {
    for (const auto& token : next_tokens()) {
      if (values.size() == count) {
        break;
      }
      values.push_back(parse<T>(token));
    }
  }
  return values;
}

}  // namespace lpf
