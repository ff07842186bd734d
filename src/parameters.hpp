#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lpf {

/// Settings for a run of lpf_tool, read from a "key value..." configuration
/// file with one key per line.
struct Parameters {
  Parameters() = default;
  Parameters(const std::string& config_file);
  void check() const;
  std::string get_path(const std::string& filename) const;

  static constexpr auto UNINIT_STR = "uninitialized";

  int32_t nrow = -1;
  int32_t ncol = -1;
  int32_t nlay = -1;
  int32_t nper = 1;

  std::vector<int32_t> steady;  // per stress period, 1 = steady state
  std::vector<int32_t> laycbd;  // per layer

  std::string model_ws    = ".";
  std::string model_name  = UNINIT_STR;
  std::string lpf_file    = UNINIT_STR;
  std::string ibound_file = "";

  int32_t check_level  = 1;
  int32_t verbose      = 0;
  int32_t write_output = 0;

  void print() const;
};

}  // namespace lpf
