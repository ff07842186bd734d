#pragma once

#include "layer_array.hpp"

#include <richdem/common/Array2D.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lpf {

class Model;

/// A MODFLOW input package attached to a model. The model owns its packages;
/// a package only keeps a reference back to the model it belongs to.
class Package {
 public:
  Package(const Model& model, std::string package_type, std::string extension, const int32_t unit_number);
  virtual ~Package() = default;

  const std::string& package_type() const { return package_type_; }
  const std::string& extension() const { return extension_; }
  int32_t unit_number() const { return unit_number_; }
  const Model& parent() const { return model_; }

  std::string file_name() const;
  std::filesystem::path file_path() const;

  virtual void write_file(const bool check = true) const = 0;

 protected:
  const Model& model_;
  std::string package_type_;
  std::string extension_;
  int32_t unit_number_;
};

/// The parts of a groundwater model a package needs to know about: grid
/// dimensions, which stress periods are steady, which layers sit on confining
/// beds, which cells are active, and the bookkeeping of packages and units.
class Model {
 public:
  Model(
      std::string name,
      const int32_t nrow,
      const int32_t ncol,
      const int32_t nlay,
      const int32_t nper,
      std::filesystem::path model_ws = ".");
  Model(const Model&)            = delete;
  Model& operator=(const Model&) = delete;

  const std::string& name() const { return name_; }
  const std::filesystem::path& model_ws() const { return model_ws_; }

  int32_t nrow() const { return nrow_; }
  int32_t ncol() const { return ncol_; }
  int32_t nlay() const { return nlay_; }
  int32_t nper() const { return nper_; }

  bool verbose() const { return verbose_; }
  void set_verbose(const bool verbose) { verbose_ = verbose; }

  // Discretization
  void set_steady(std::vector<bool> steady);
  void set_laycbd(std::vector<int32_t> laycbd);
  const std::vector<bool>& steady() const { return steady_; }
  const std::vector<int32_t>& laycbd() const { return laycbd_; }
  int32_t laycbd(const int32_t k) const { return laycbd_.at(k); }
  bool transient() const;

  // Basic package
  void set_ibound(const int32_t k, richdem::Array2D<int32_t> ibound);
  const richdem::Array2D<int32_t>& ibound(const int32_t k) const { return ibound_.at(k); }
  bool active(const int32_t k, const int32_t x, const int32_t y) const { return ibound_[k](x, y) != 0; }

  // Multiplier and zone arrays used by parameters, and PVAL overrides
  void add_mult_array(const std::string& name, richdem::Array2D<float> mult);
  void add_zone_array(const std::string& name, richdem::Array2D<int32_t> zone);
  const richdem::Array2D<float>& mult_array(const std::string& name) const;
  const richdem::Array2D<int32_t>& zone_array(const std::string& name) const;
  void set_parameter_value(const std::string& name, const double value);
  std::optional<double> parameter_value(const std::string& name) const;

  // Files and units
  void add_external_unit(const int32_t unit, const std::string& filename);
  void add_pop_key(const int32_t unit);
  const std::set<int32_t>& units_consumed() const { return units_consumed_; }
  ArrayContext array_context(const int32_t unit_number = 0) const;

  /// Attach a package. Returns false, leaving the model unchanged, when a
  /// package of the same type is already attached.
  bool add_package(std::shared_ptr<Package> package);
  std::shared_ptr<Package> get_package(const std::string& package_type) const;

 private:
  std::string name_;
  std::filesystem::path model_ws_;
  int32_t nrow_;
  int32_t ncol_;
  int32_t nlay_;
  int32_t nper_;
  bool verbose_ = false;

  std::vector<bool> steady_;
  std::vector<int32_t> laycbd_;
  std::vector<richdem::Array2D<int32_t>> ibound_;

  std::map<std::string, richdem::Array2D<float>> mult_arrays_;
  std::map<std::string, richdem::Array2D<int32_t>> zone_arrays_;
  std::map<std::string, double> parameter_values_;

  std::map<int32_t, std::string> external_units_;
  std::set<int32_t> units_consumed_;

  std::vector<std::shared_ptr<Package>> packages_;
};

}  // namespace lpf
