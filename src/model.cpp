#include "model.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lpf {

Package::Package(const Model& model, std::string package_type, std::string extension, const int32_t unit_number)
    : model_(model),
      package_type_(std::move(package_type)),
      extension_(std::move(extension)),
      unit_number_(unit_number) {}

std::string Package::file_name() const {
  return model_.name() + "." + extension_;
}

std::filesystem::path Package::file_path() const {
  return model_.model_ws() / file_name();
}

Model::Model(
    std::string name,
    const int32_t nrow,
    const int32_t ncol,
    const int32_t nlay,
    const int32_t nper,
    std::filesystem::path model_ws)
    : name_(std::move(name)), model_ws_(std::move(model_ws)), nrow_(nrow), ncol_(ncol), nlay_(nlay), nper_(nper) {
  if (nrow <= 0 || ncol <= 0 || nlay <= 0 || nper <= 0) {
    throw std::invalid_argument(fmt::format(
        "Model dimensions must be positive (nrow={}, ncol={}, nlay={}, nper={})!", nrow, ncol, nlay, nper));
  }

  steady_.assign(nper, true);
  laycbd_.assign(nlay, 0);
  ibound_.assign(nlay, richdem::Array2D<int32_t>(ncol, nrow, 1));
}

void Model::set_steady(std::vector<bool> steady) {
  if (steady.size() != static_cast<size_t>(nper_)) {
    throw std::invalid_argument(
        fmt::format("Got {} steady flags for a model with {} stress periods!", steady.size(), nper_));
  }
  steady_ = std::move(steady);
}

void Model::set_laycbd(std::vector<int32_t> laycbd) {
  if (laycbd.size() != static_cast<size_t>(nlay_)) {
    throw std::invalid_argument(fmt::format("Got {} LAYCBD flags for a model with {} layers!", laycbd.size(), nlay_));
  }
  laycbd_ = std::move(laycbd);
}

bool Model::transient() const {
  return !std::all_of(steady_.begin(), steady_.end(), [](const bool s) { return s; });
}

void Model::set_ibound(const int32_t k, richdem::Array2D<int32_t> ibound) {
  if (k < 0 || k >= nlay_) {
    throw std::out_of_range(fmt::format("Layer {} is outside a model with {} layers!", k, nlay_));
  }
  if (ibound.width() != ncol_ || ibound.height() != nrow_) {
    throw std::invalid_argument("IBOUND dimensions don't match the model grid!");
  }
  ibound_[k] = std::move(ibound);
}

void Model::add_mult_array(const std::string& name, richdem::Array2D<float> mult) {
  if (mult.width() != ncol_ || mult.height() != nrow_) {
    throw std::invalid_argument("Multiplier array '" + name + "' doesn't match the model grid!");
  }
  mult_arrays_[to_lower(name)] = std::move(mult);
}

void Model::add_zone_array(const std::string& name, richdem::Array2D<int32_t> zone) {
  if (zone.width() != ncol_ || zone.height() != nrow_) {
    throw std::invalid_argument("Zone array '" + name + "' doesn't match the model grid!");
  }
  zone_arrays_[to_lower(name)] = std::move(zone);
}

const richdem::Array2D<float>& Model::mult_array(const std::string& name) const {
  const auto found = mult_arrays_.find(to_lower(name));
  if (found == mult_arrays_.end()) {
    throw std::runtime_error("Multiplier array '" + name + "' is not defined!");
  }
  return found->second;
}

const richdem::Array2D<int32_t>& Model::zone_array(const std::string& name) const {
  const auto found = zone_arrays_.find(to_lower(name));
  if (found == zone_arrays_.end()) {
    throw std::runtime_error("Zone array '" + name + "' is not defined!");
  }
  return found->second;
}

void Model::set_parameter_value(const std::string& name, const double value) {
  parameter_values_[to_lower(name)] = value;
}

std::optional<double> Model::parameter_value(const std::string& name) const {
  const auto found = parameter_values_.find(to_lower(name));
  if (found == parameter_values_.end()) {
    return std::nullopt;
  }
  return found->second;
}

void Model::add_external_unit(const int32_t unit, const std::string& filename) {
  external_units_[unit] = filename;
}

void Model::add_pop_key(const int32_t unit) {
  units_consumed_.insert(unit);
}

ArrayContext Model::array_context(const int32_t unit_number) const {
  return ArrayContext{model_ws_, external_units_, unit_number};
}

bool Model::add_package(std::shared_ptr<Package> package) {
  if (get_package(package->package_type())) {
    return false;
  }
  packages_.push_back(std::move(package));
  return true;
}

std::shared_ptr<Package> Model::get_package(const std::string& package_type) const {
  for (const auto& package : packages_) {
    if (package->package_type() == package_type) {
      return package;
    }
  }
  return nullptr;
}

}  // namespace lpf
