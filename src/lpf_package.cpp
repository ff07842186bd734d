#include "lpf_package.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <iostream>
#include <numeric>
#include <stdexcept>

namespace lpf {

namespace {

std::vector<std::string> vertical_names(const std::vector<int32_t>& layvka) {
  std::vector<std::string> names;
  for (const auto flag : layvka) {
    names.push_back(flag != 0 ? "vani" : "vka");
  }
  return names;
}

// First parameter type defined for this step, if the layer is to be built from
// parameters instead of read as an array
std::optional<std::string> parameter_type(const LayoutStep& step, const std::optional<ParameterSet>& parameters) {
  if (!parameters) {
    return std::nullopt;
  }
  for (const auto& type : step.parameter_types) {
    if (parameters->has_type(type)) {
      return type;
    }
  }
  return std::nullopt;
}

void attach(Model& model, const std::shared_ptr<LpfPackage>& package) {
  if (!model.add_package(package)) {
    throw std::runtime_error("Model '" + model.name() + "' already has an LPF package!");
  }
}

}  // namespace

std::string option_token(const LpfOption option) {
  switch (option) {
    case LpfOption::StorageCoefficient:
      return "STORAGECOEFFICIENT";
    case LpfOption::ConstantCv:
      return "CONSTANTCV";
    case LpfOption::ThickStrt:
      return "THICKSTRT";
    case LpfOption::NoCvCorrection:
      return "NOCVCORRECTION";
    case LpfOption::NoVfc:
      return "NOVFC";
  }
  throw std::logic_error("Unknown LPF option");
}

const std::vector<LayoutStep>& lpf_layer_layout() {
  static const std::vector<LayoutStep> layout = {
      {LpfField::hk, [](const LayerConditions&) { return true; }, {"hk"}},
      {LpfField::hani, [](const LayerConditions& c) { return c.chani < 1; }, {"hani"}},
      {LpfField::vka, [](const LayerConditions&) { return true; }, {"vani", "vka", "vk"}},
      {LpfField::ss, [](const LayerConditions& c) { return c.transient; }, {"ss"}},
      {LpfField::sy, [](const LayerConditions& c) { return c.transient && c.laytyp != 0; }, {"sy"}},
      {LpfField::vkcb, [](const LayerConditions& c) { return c.laycbd > 0; }, {"vkcb"}},
      {LpfField::wetdry, [](const LayerConditions& c) { return c.laywet != 0 && c.laytyp != 0; }, {}},
  };
  return layout;
}

LpfPackage::LpfPackage(const Model& model, const LpfSettings& settings)
    : Package(model, "LPF", settings.extension, settings.unitnumber),
      ipakcb(settings.ipakcb != 0 ? 53 : 0),
      hdry(settings.hdry),
      laytyp(settings.laytyp.resolve("laytyp", model.nlay())),
      layavg(settings.layavg.resolve("layavg", model.nlay())),
      chani(settings.chani.resolve("chani", model.nlay())),
      layvka(settings.layvka.resolve("layvka", model.nlay())),
      laywet(settings.laywet.resolve("laywet", model.nlay())),
      wetfct(settings.wetfct),
      iwetit(settings.iwetit),
      ihdwet(settings.ihdwet) {
  if (settings.storagecoefficient) {
    options.push_back(LpfOption::StorageCoefficient);
  }
  if (settings.constantcv) {
    options.push_back(LpfOption::ConstantCv);
  }
  if (settings.thickstrt) {
    options.push_back(LpfOption::ThickStrt);
  }
  if (settings.nocvcorrection) {
    options.push_back(LpfOption::NoCvCorrection);
  }
  if (settings.novfc) {
    options.push_back(LpfOption::NoVfc);
  }

  const auto nrow    = model.nrow();
  const auto ncol    = model.ncol();
  const auto every   = [&](const std::string& name) { return std::vector<std::string>(model.nlay(), name); };
  const auto ss_name = settings.storagecoefficient ? "storage" : "ss";

  hk     = settings.hk.resolve(every("hk"), nrow, ncol);
  hani   = settings.hani.resolve(every("hani"), nrow, ncol);
  vka    = settings.vka.resolve(vertical_names(layvka), nrow, ncol);
  ss     = settings.ss.resolve(every(ss_name), nrow, ncol);
  sy     = settings.sy.resolve(every("sy"), nrow, ncol);
  vkcb   = settings.vkcb.resolve(every("vkcb"), nrow, ncol);
  wetdry = settings.wetdry.resolve(every("wetdry"), nrow, ncol);

  if (settings.parameters && !settings.parameters->empty()) {
    parameters = settings.parameters;
  }
}

std::shared_ptr<LpfPackage> LpfPackage::create(Model& model, const LpfSettings& settings) {
  auto package = std::make_shared<LpfPackage>(model, settings);
  attach(model, package);
  if (package->ipakcb != 0) {
    model.add_pop_key(package->ipakcb);
  }
  return package;
}

bool LpfPackage::has_option(const LpfOption option) const {
  return std::find(options.begin(), options.end(), option) != options.end();
}

bool LpfPackage::wetting() const {
  return std::accumulate(laywet.begin(), laywet.end(), 0) > 0;
}

LayerConditions LpfPackage::conditions(const int32_t k) const {
  return LayerConditions{model_.transient(), laytyp.at(k), chani.at(k), laywet.at(k), model_.laycbd(k)};
}

const std::vector<LayerArray<float>>& LpfPackage::field(const LpfField which) const {
  switch (which) {
    case LpfField::hk:
      return hk;
    case LpfField::hani:
      return hani;
    case LpfField::vka:
      return vka;
    case LpfField::ss:
      return ss;
    case LpfField::sy:
      return sy;
    case LpfField::vkcb:
      return vkcb;
    case LpfField::wetdry:
      return wetdry;
  }
  throw std::logic_error("Unknown LPF field");
}

std::vector<LayerArray<float>>& LpfPackage::field(const LpfField which) {
  switch (which) {
    case LpfField::hk:
      return hk;
    case LpfField::hani:
      return hani;
    case LpfField::vka:
      return vka;
    case LpfField::ss:
      return ss;
    case LpfField::sy:
      return sy;
    case LpfField::vkcb:
      return vkcb;
    case LpfField::wetdry:
      return wetdry;
  }
  throw std::logic_error("Unknown LPF field");
}

void LpfPackage::write(std::ostream& out) const {
  const auto context = model_.array_context(unit_number_);

  // Item 0: heading
  out << heading << '\n';

  // Item 1: IPAKCB HDRY NPLPF [options]
  std::string option_text;
  for (const auto option : options) {
    option_text += " " + option_token(option);
  }
  out << fmt::format("{:10d}{:10.6G}{:10d}{}\n", ipakcb, hdry, nplpf(), option_text);

  // Items 2-6: LAYTYP LAYAVG CHANI LAYVKA LAYWET
  write_layer_values(out, laytyp);
  write_layer_values(out, layavg);
  write_layer_values(out, chani);
  write_layer_values(out, layvka);
  write_layer_values(out, laywet);

  // Item 7: WETFCT IWETIT IHDWET
  if (wetting()) {
    out << fmt::format("{:10.6f}{:10d}{:10d}\n", wetfct, iwetit, ihdwet);
  }

  // Items 8-9: parameter definitions
  if (parameters) {
    parameters->write(out);
  }

  // Items 10-16, layer by layer
  for (int32_t k = 0; k < model_.nlay(); k++) {
    const auto cond = conditions(k);
    for (const auto& step : lpf_layer_layout()) {
      if (!step.present(cond)) {
        continue;
      }
      const auto& layer = field(step.field)[k];
      if (parameter_type(step, parameters)) {
        out << fmt::format("{:10d} #{} print code, layer {}\n", 0, layer.name(), k + 1);
      } else {
        layer.write(out, context);
      }
    }
  }
}

void LpfPackage::write_file(const bool run_check) const {
  if (run_check) {
    const auto chk_path = model_.model_ws() / (package_type_ + ".chk");
    std::ofstream chk(chk_path);
    if (!chk.good()) {
      throw std::runtime_error("Failed to open check file '" + chk_path.string() + "'!");
    }
    check(&chk, model_.verbose(), 1);
  }

  const auto path = file_path();
  std::ofstream fout(path);
  if (!fout.good()) {
    throw std::runtime_error("Failed to open '" + path.string() + "' for writing!");
  }
  write(fout);
  if (!fout.good()) {
    throw std::runtime_error("Failed to write '" + path.string() + "'!");
  }
}

std::shared_ptr<LpfPackage> LpfPackage::load(const std::string& filename, Model& model, const bool check) {
  std::ifstream fin(filename);
  if (!fin.good()) {
    throw std::runtime_error("Failed to open LPF file '" + filename + "'!");
  }
  return read(fin, model, filename, check);
}

std::shared_ptr<LpfPackage> LpfPackage::read(
    std::istream& in,
    Model& model,
    const std::string& source_name,
    const bool run_check) {
  const bool verbose = model.verbose();
  const auto nlay    = model.nlay();

  if (verbose) {
    std::cout << "p loading lpf package file..." << std::endl;
  }

  LineReader reader(in, source_name);
  LpfSettings settings;

  // Item 1 follows any number of comment lines
  if (verbose) {
    std::cout << "p    loading IPAKCB, HDRY, NPLPF..." << std::endl;
  }
  const auto header = split_tokens(reader.next_data_line());
  if (header.size() < 3) {
    reader.fail("expected IPAKCB, HDRY and NPLPF");
  }
  const auto ipakcb = reader.parse<int32_t>(header[0]);
  settings.hdry     = reader.parse<double>(header[1]);
  const auto nplpf  = reader.parse<int32_t>(header[2]);
  if (nplpf < 0) {
    reader.fail("NPLPF can't be negative");
  }
  settings.ipakcb = ipakcb;

  for (size_t i = 3; i < header.size(); i++) {
    const auto token = to_upper(header[i]);
    if (token.find("STORAGECOEFFICIENT") != std::string::npos) {
      settings.storagecoefficient = true;
    } else if (token.find("CONSTANTCV") != std::string::npos) {
      settings.constantcv = true;
    } else if (token.find("THICKSTRT") != std::string::npos) {
      settings.thickstrt = true;
    } else if (token.find("NOCVCORRECTION") != std::string::npos) {
      settings.nocvcorrection = true;
    } else if (token.find("NOVFC") != std::string::npos) {
      settings.novfc = true;
    }
  }

  const auto read_flags = [&](const std::string& name, auto type_tag) {
    using T = decltype(type_tag);
    if (verbose) {
      std::cout << "p    loading " << name << "..." << std::endl;
    }
    return read_layer_values<T>(reader, nlay);
  };

  const auto laytyp = read_flags("LAYTYP", int32_t{});
  settings.laytyp   = laytyp;
  settings.layavg   = read_flags("LAYAVG", int32_t{});
  settings.chani    = read_flags("CHANI", float{});
  settings.layvka   = read_flags("LAYVKA", int32_t{});
  const auto laywet = read_flags("LAYWET", int32_t{});
  settings.laywet   = laywet;

  if (std::accumulate(laywet.begin(), laywet.end(), 0) > 0) {
    if (verbose) {
      std::cout << "p    loading WETFCT, IWETIT, IHDWET..." << std::endl;
    }
    const auto t = reader.next_tokens();
    if (t.size() < 3) {
      reader.fail("expected WETFCT, IWETIT and IHDWET");
    }
    settings.wetfct = reader.parse<double>(t[0]);
    settings.iwetit = reader.parse<int32_t>(t[1]);
    settings.ihdwet = reader.parse<int32_t>(t[2]);
  }

  if (nplpf > 0) {
    settings.parameters = ParameterSet::load(reader, nplpf, verbose);
  }

  // Every array starts at its default. Those the layout says are in the file
  // are replaced as they are read, keeping the name the constructor resolved.
  auto package       = std::make_shared<LpfPackage>(model, settings);
  const auto context = model.array_context(package->unit_number());

  for (int32_t k = 0; k < nlay; k++) {
    const auto cond = package->conditions(k);
    for (const auto& step : lpf_layer_layout()) {
      if (!step.present(cond)) {
        continue;
      }

      auto& layers    = package->field(step.field);
      const auto name = layers[k].name();
      if (verbose) {
        std::cout << fmt::format("p    loading {} layer {:3d}...", name, k + 1) << std::endl;
      }

      if (const auto ptype = parameter_type(step, package->parameters)) {
        reader.next_line();  // print code
        layers[k] = LayerArray<float>(name, package->parameters->fill(model, *ptype, k));
      } else {
        layers[k] = LayerArray<float>::load(reader, model.nrow(), model.ncol(), name, context);
      }
    }
  }

  attach(model, package);
  if (ipakcb != 0) {
    model.add_pop_key(ipakcb);
  }

  if (run_check) {
    const auto chk_path = model.model_ws() / (package->package_type() + ".chk");
    std::ofstream chk(chk_path);
    if (!chk.good()) {
      throw std::runtime_error("Failed to open check file '" + chk_path.string() + "'!");
    }
    package->check(&chk, false, 0);
  }

  return package;
}

}  // namespace lpf
