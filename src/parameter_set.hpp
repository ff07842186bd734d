#pragma once

#include "file_reader.hpp"
#include "model.hpp"

#include <richdem/common/Array2D.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace lpf {

struct ParameterCluster {
  int32_t layer = 1;  // 1-based, as in the file
  std::string mltarr = "none";
  std::string zonarr = "all";
  std::vector<int32_t> zones;
};

struct ParameterDefinition {
  std::string name;
  std::string type;
  double value = 0;
  std::vector<ParameterCluster> clusters;
};

/// Named multiplier/zone parameters of a package. A parameter of a given type
/// stands in for the array of that type: each layer is built by summing
/// value * multiplier over the zones its clusters select.
class ParameterSet {
 public:
  ParameterSet() = default;
  explicit ParameterSet(std::vector<ParameterDefinition> definitions);

  /// Read `count` definitions, each "PARNAM PARTYP Parval NCLU" followed by
  /// NCLU "Layer Mltarr Zonarr [IZ...]" lines
  static ParameterSet load(LineReader& reader, const int32_t count, const bool verbose);

  void write(std::ostream& out) const;

  size_t size() const { return definitions_.size(); }
  bool empty() const { return definitions_.empty(); }
  const std::vector<ParameterDefinition>& definitions() const { return definitions_; }
  const std::vector<std::string>& types() const { return types_; }
  bool has_type(const std::string& type) const;

  /// Values of layer `k` (0-based) for parameter type `type`
  richdem::Array2D<float> fill(const Model& model, const std::string& type, const int32_t k) const;

 private:
  std::vector<ParameterDefinition> definitions_;
  std::vector<std::string> types_;
};

}  // namespace lpf
