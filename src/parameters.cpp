#include "parameters.hpp"

#include <fmt/core.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace lpf {

namespace {

std::vector<int32_t> read_list(std::stringstream& ss) {
  std::vector<int32_t> values;
  int32_t value;
  while (ss >> value) {
    values.push_back(value);
  }
  return values;
}

std::string join(const std::vector<int32_t>& values) {
  std::string str;
  for (const auto v : values) {
    str += fmt::format("{} ", v);
  }
  return str;
}

}  // namespace

// Real initializer
Parameters::Parameters(const std::string& config_file) {
  std::ifstream fin(config_file);

  if (!fin.good()) {
    throw std::runtime_error("Failed to read config file!");
  }

  std::string line;
  while (std::getline(fin, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }

    std::stringstream ss(line);
    std::string key;
    ss >> key;

    // Dummy key to make it easier to alphabetize list below
    if (key.empty()) {
    } else if (key == "check_level") {
      ss >> check_level;
    } else if (key == "ibound_file") {
      ss >> ibound_file;
    } else if (key == "laycbd") {
      laycbd = read_list(ss);
    } else if (key == "lpf_file") {
      ss >> lpf_file;
    } else if (key == "model_name") {
      ss >> model_name;
    } else if (key == "model_ws") {
      ss >> model_ws;
    } else if (key == "ncol") {
      ss >> ncol;
    } else if (key == "nlay") {
      ss >> nlay;
    } else if (key == "nper") {
      ss >> nper;
    } else if (key == "nrow") {
      ss >> nrow;
    } else if (key == "steady") {
      steady = read_list(ss);
    } else if (key == "verbose") {
      ss >> verbose;
    } else if (key == "write_output") {
      ss >> write_output;
    } else {
      throw std::runtime_error("Unrecognised key: " + key);
    }
  }

  // Defaults that depend on the grid
  if (steady.empty() && nper > 0) {
    steady.assign(nper, 1);
  }
  if (laycbd.empty() && nlay > 0) {
    laycbd.assign(nlay, 0);
  }

  check();
}

void Parameters::check() const {
  const auto check_positive = [](const std::string name, const auto val) {
    if (val <= 0) {
      throw std::runtime_error("Please enter a positive value for " + name);
    }
  };

  const auto check_string_init = [&](const std::string name, const std::string& val) {
    if (val == UNINIT_STR) {
      throw std::runtime_error("Please provide a value for " + name);
    }
  };

  const auto check_binary = [](const auto val, const std::string& msg) {
    if (val != 0 && val != 1) {
      throw std::runtime_error(msg);
    }
  };

  check_positive("nrow", nrow);
  check_positive("ncol", ncol);
  check_positive("nlay", nlay);
  check_positive("nper", nper);
  if (steady.size() != static_cast<size_t>(nper)) {
    throw std::runtime_error(
        fmt::format("steady needs one flag per stress period ({} given, nper is {})", steady.size(), nper));
  }
  if (laycbd.size() != static_cast<size_t>(nlay)) {
    throw std::runtime_error(
        fmt::format("laycbd needs one flag per layer ({} given, nlay is {})", laycbd.size(), nlay));
  }
  for (const auto s : steady) {
    check_binary(s, "set each steady flag to 1 for a steady-state stress period or 0 for a transient one.");
  }
  if (check_level < 0) {
    throw std::runtime_error("check_level must be 0 (summary) or greater (list offending cells)");
  }
  check_binary(verbose, "set verbose to 1 to print loading progress, or 0 to stay quiet.");
  check_binary(write_output, "set write_output to 1 to rewrite the LPF file into model_ws, or 0 to only check it.");
  check_string_init("model_name", model_name);
  check_string_init("lpf_file", lpf_file);
}

// Relative paths are taken from the model workspace
std::string Parameters::get_path(const std::string& filename) const {
  const std::filesystem::path path(filename);
  if (path.is_absolute()) {
    return path.string();
  }
  return (std::filesystem::path(model_ws) / path).string();
}

void Parameters::print() const {
  std::cout << "c check_level  = " << check_level << std::endl;
  std::cout << "c ibound_file  = " << ibound_file << std::endl;
  std::cout << "c laycbd       = " << join(laycbd) << std::endl;
  std::cout << "c lpf_file     = " << lpf_file << std::endl;
  std::cout << "c model_name   = " << model_name << std::endl;
  std::cout << "c model_ws     = " << model_ws << std::endl;
  std::cout << "c ncol         = " << ncol << std::endl;
  std::cout << "c nlay         = " << nlay << std::endl;
  std::cout << "c nper         = " << nper << std::endl;
  std::cout << "c nrow         = " << nrow << std::endl;
  std::cout << "c steady       = " << join(steady) << std::endl;
  std::cout << "c verbose      = " << verbose << std::endl;
  std::cout << "c write_output = " << write_output << std::endl;
}

}  // namespace lpf
