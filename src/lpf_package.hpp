#pragma once

#include "layer_array.hpp"
#include "model.hpp"
#include "parameter_set.hpp"

#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace lpf {

enum class LpfOption { StorageCoefficient, ConstantCv, ThickStrt, NoCvCorrection, NoVfc };

std::string option_token(const LpfOption option);

enum class LpfField { hk, hani, vka, ss, sy, vkcb, wetdry };

/// What decides whether a layer carries a given array in the file
struct LayerConditions {
  bool transient = false;
  int32_t laytyp = 0;
  float chani    = 1;
  int32_t laywet = 0;
  int32_t laycbd = 0;
};

/// One entry of the per-layer file layout. Writing and reading walk the same
/// table, so the two cannot disagree about which arrays are present.
struct LayoutStep {
  LpfField field;
  bool (*present)(const LayerConditions&);
  std::vector<std::string> parameter_types;  // in order of preference
};

const std::vector<LayoutStep>& lpf_layer_layout();

/// Construction values for an LPF package. Scalars are broadcast to every
/// layer or cell; lists must have one entry per layer.
struct LpfSettings {
  int32_t ipakcb = 53;
  double hdry    = -1.0e30;

  LayerInput<int32_t> laytyp = 0;
  LayerInput<int32_t> layavg = 0;
  LayerInput<float> chani    = 1.0f;
  LayerInput<int32_t> layvka = 0;
  LayerInput<int32_t> laywet = 0;

  double wetfct  = 0.1;
  int32_t iwetit = 1;
  int32_t ihdwet = 0;

  FieldInput hk     = 1.0;
  FieldInput hani   = 1.0;
  FieldInput vka    = 1.0;
  FieldInput ss     = 1.0e-5;
  FieldInput sy     = 0.15;
  FieldInput vkcb   = 0.0;
  FieldInput wetdry = -0.01;

  bool storagecoefficient = false;
  bool constantcv         = false;
  bool thickstrt          = false;
  bool nocvcorrection     = false;
  bool novfc              = false;

  std::optional<ParameterSet> parameters;

  std::string extension = "lpf";
  int32_t unitnumber    = 15;
};

struct CheckResult {
  bool errors = false;
  std::string text;
};

/// The Layer Property Flow package: per-layer flags, per-cell hydraulic
/// properties, and the options that control how MODFLOW uses them.
class LpfPackage : public Package {
 public:
  LpfPackage(const Model& model, const LpfSettings& settings = LpfSettings());

  /// Build a package and attach it to `model`. Throws if the model already
  /// has an LPF package.
  static std::shared_ptr<LpfPackage> create(Model& model, const LpfSettings& settings = LpfSettings());

  static std::shared_ptr<LpfPackage> load(const std::string& filename, Model& model, const bool check = true);
  static std::shared_ptr<LpfPackage> read(
      std::istream& in,
      Model& model,
      const std::string& source_name = "<stream>",
      const bool check               = false);

  void write_file(const bool check = true) const override;
  void write(std::ostream& out) const;

  /// Range checks on the hydraulic properties of active cells. `level` 0
  /// gives a summary; anything higher also lists the offending cells.
  CheckResult check(std::ostream* report = nullptr, const bool verbose = true, const int level = 1) const;

  int32_t nplpf() const { return parameters ? static_cast<int32_t>(parameters->size()) : 0; }
  bool has_option(const LpfOption option) const;
  bool wetting() const;

  LayerConditions conditions(const int32_t k) const;
  const std::vector<LayerArray<float>>& field(const LpfField which) const;
  std::vector<LayerArray<float>>& field(const LpfField which);

  std::string heading = "# LPF package file for MODFLOW";

  int32_t ipakcb;
  double hdry;
  std::vector<LpfOption> options;

  std::vector<int32_t> laytyp;
  std::vector<int32_t> layavg;
  std::vector<float> chani;
  std::vector<int32_t> layvka;
  std::vector<int32_t> laywet;

  double wetfct;
  int32_t iwetit;
  int32_t ihdwet;

  std::vector<LayerArray<float>> hk;
  std::vector<LayerArray<float>> hani;
  std::vector<LayerArray<float>> vka;
  std::vector<LayerArray<float>> ss;
  std::vector<LayerArray<float>> sy;
  std::vector<LayerArray<float>> vkcb;
  std::vector<LayerArray<float>> wetdry;

  std::optional<ParameterSet> parameters;
};

}  // namespace lpf
