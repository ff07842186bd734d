#include "lpf_package.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iostream>

namespace lpf {

namespace {

struct BadCell {
  int32_t k;
  int32_t row;
  int32_t col;
  float value;
};

struct FieldCheck {
  const std::vector<LayerArray<float>>& layers;
  std::vector<bool> use_layer;  // layers the solver actually reads
  bool (*acceptable)(const float);
  std::string error;
  std::string description;
};

// Inactive cells and unused layers never count against a field, and the
// stored values are only read, never overwritten
std::vector<BadCell> find_bad_cells(const Model& model, const FieldCheck& fc) {
  std::vector<BadCell> bad;
  for (int32_t k = 0; k < model.nlay(); k++) {
    if (!fc.use_layer[k]) {
      continue;
    }
    const auto& layer = fc.layers[k];
    for (int32_t y = 0; y < model.nrow(); y++) {
      for (int32_t x = 0; x < model.ncol(); x++) {
        if (model.active(k, x, y) && !fc.acceptable(layer(x, y))) {
          bad.push_back(BadCell{k, y, x, layer(x, y)});
        }
      }
    }
  }
  return bad;
}

std::string list_bad_cells(const std::vector<BadCell>& bad, const std::vector<LayerArray<float>>& layers) {
  std::string txt;
  int32_t kon = -1;
  for (const auto& cell : bad) {
    if (cell.k > kon) {
      kon = cell.k;
      txt += fmt::format("    {:>10}{:>10}{:>10}{:>15}\n", "layer", "row", "column", layers[cell.k].name());
    }
    txt += fmt::format("    {:10d}{:10d}{:10d}{:15.7g}\n", cell.k + 1, cell.row + 1, cell.col + 1, cell.value);
  }
  return txt;
}

}  // namespace

CheckResult LpfPackage::check(std::ostream* report, const bool verbose, const int level) const {
  const auto nlay = model_.nlay();

  const auto layers_where = [&](auto&& predicate) {
    std::vector<bool> use(nlay);
    for (int32_t k = 0; k < nlay; k++) {
      use[k] = predicate(k);
    }
    return use;
  };
  const auto every_layer = layers_where([](int32_t) { return true; });

  std::vector<FieldCheck> checks;
  checks.push_back(FieldCheck{
      hk,
      every_layer,
      [](const float v) { return v >= 0; },
      "Negative horizontal hydraulic conductivity",
      "horizontal hydraulic conductivity"});
  checks.push_back(FieldCheck{
      hani,
      layers_where([&](int32_t k) { return chani[k] <= 0; }),
      [](const float v) { return v >= 0; },
      "Negative horizontal hydraulic conductivity ratio",
      "horizontal hydraulic conductivity ratio"});
  checks.push_back(FieldCheck{
      vka,
      every_layer,
      [](const float v) { return v > 0; },
      "Negative or zero vertical hydraulic conductivity",
      "vertical hydraulic conductivity"});
  checks.push_back(FieldCheck{
      vkcb,
      layers_where([&](int32_t k) { return model_.laycbd(k) > 0; }),
      [](const float v) { return v >= 0; },
      "Negative quasi-3D confining bed vertical hydraulic conductivity",
      "quasi-3D confining bed vertical hydraulic conductivity"});
  if (model_.transient()) {
    checks.push_back(FieldCheck{
        ss, every_layer, [](const float v) { return v >= 0; }, "Negative specific storage", "specific storage"});
    checks.push_back(FieldCheck{
        sy,
        layers_where([&](int32_t k) { return laytyp[k] != 0; }),
        [](const float v) { return v >= 0; },
        "Negative specific yield",
        "specific yield"});
  }

  CheckResult result;
  std::string summary;
  std::string detail;

  for (const auto& fc : checks) {
    const auto bad = find_bad_cells(model_, fc);
    if (!bad.empty()) {
      result.errors = true;
      summary += fmt::format("  ERROR: {} specified.\n", fc.error);
      if (level > 0) {
        detail += list_bad_cells(bad, fc.layers);
      }
    } else if (std::find(fc.use_layer.begin(), fc.use_layer.end(), true) != fc.use_layer.end()) {
      summary += fmt::format("  Specified {} is OK.\n", fc.description);
    }
  }

  result.text = fmt::format("\n{} PACKAGE DATA VALIDATION:\n", package_type_) + summary;
  if (level > 0 && result.errors) {
    result.text += fmt::format("\n  DETAILED SUMMARY OF {} ERRORS:\n", package_type_) + detail;
  }

  if (report) {
    *report << result.text << '\n';
  }
  if (verbose) {
    std::cout << result.text << std::endl;
  }

  return result;
}

}  // namespace lpf
