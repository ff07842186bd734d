#include "layer_array.hpp"

namespace lpf {

FieldInput::FieldInput(const double value) : value_(std::in_place_index<0>, value) {}

FieldInput::FieldInput(std::vector<double> layer_values) : value_(std::in_place_index<1>, std::move(layer_values)) {}

FieldInput::FieldInput(std::vector<richdem::Array2D<float>> layer_grids)
    : value_(std::in_place_index<2>, std::move(layer_grids)) {}

FieldInput::FieldInput(std::vector<LayerArray<float>> layers) : value_(std::in_place_index<3>, std::move(layers)) {}

std::vector<LayerArray<float>> FieldInput::resolve(
    const std::vector<std::string>& names,
    const int32_t nrow,
    const int32_t ncol) const {
  const auto nlay = names.size();

  const auto check_layer_count = [&](const size_t count) {
    if (count != nlay) {
      throw std::invalid_argument(
          fmt::format("'{}' was given {} layers but the model has {}!", names.front(), count, nlay));
    }
  };

  std::vector<LayerArray<float>> layers;
  layers.reserve(nlay);

  if (const auto* value = std::get_if<0>(&value_)) {
    for (size_t k = 0; k < nlay; k++) {
      layers.emplace_back(names[k], nrow, ncol, static_cast<float>(*value));
    }
  } else if (const auto* layer_values = std::get_if<1>(&value_)) {
    check_layer_count(layer_values->size());
    for (size_t k = 0; k < nlay; k++) {
      layers.emplace_back(names[k], nrow, ncol, static_cast<float>((*layer_values)[k]));
    }
  } else if (const auto* layer_grids = std::get_if<2>(&value_)) {
    check_layer_count(layer_grids->size());
    for (size_t k = 0; k < nlay; k++) {
      const auto& grid = (*layer_grids)[k];
      if (grid.width() != ncol || grid.height() != nrow) {
        throw std::invalid_argument(fmt::format(
            "Layer {} of '{}' is {}x{} but the model grid is {}x{}!",
            k + 1,
            names[k],
            grid.height(),
            grid.width(),
            nrow,
            ncol));
      }
      layers.emplace_back(names[k], grid);
    }
  } else {
    const auto& given = std::get<3>(value_);
    check_layer_count(given.size());
    for (size_t k = 0; k < nlay; k++) {
      if (given[k].nrow() != nrow || given[k].ncol() != ncol) {
        throw std::invalid_argument(fmt::format(
            "Layer {} of '{}' is {}x{} but the model grid is {}x{}!",
            k + 1,
            names[k],
            given[k].nrow(),
            given[k].ncol(),
            nrow,
            ncol));
      }
      layers.push_back(given[k].renamed(names[k]));
    }
  }

  return layers;
}

}  // namespace lpf
