#include "parameter_set.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <iostream>
#include <utility>

namespace lpf {

namespace {

// MODFLOW only looks at the first ten characters of array names
std::string array_name(const std::string& token) {
  return to_lower(token.substr(0, 10));
}

}  // namespace

ParameterSet::ParameterSet(std::vector<ParameterDefinition> definitions) : definitions_(std::move(definitions)) {
  for (auto& def : definitions_) {
    def.name = to_lower(def.name);
    def.type = to_lower(def.type);
    for (auto& cluster : def.clusters) {
      cluster.mltarr = array_name(cluster.mltarr);
      cluster.zonarr = array_name(cluster.zonarr);
    }
    if (!has_type(def.type)) {
      types_.push_back(def.type);
    }
  }
}

ParameterSet ParameterSet::load(LineReader& reader, const int32_t count, const bool verbose) {
  std::vector<ParameterDefinition> definitions;

  for (int32_t n = 0; n < count; n++) {
    const auto t = reader.next_tokens();
    if (t.size() < 4) {
      reader.fail("parameter definitions need PARNAM, PARTYP, Parval and NCLU");
    }

    ParameterDefinition def;
    def.name            = t[0];
    def.type            = t[1];
    def.value           = reader.parse<double>(t[2]);
    const int32_t nclu  = reader.parse<int32_t>(t[3]);

    if (verbose) {
      std::cout << "p    loading parameter '" << to_lower(def.name) << "' (" << to_lower(def.type) << ")..."
                << std::endl;
    }

    for (int32_t c = 0; c < nclu; c++) {
      const auto ct = reader.next_tokens();
      if (ct.size() < 3) {
        reader.fail("parameter clusters need Layer, Mltarr and Zonarr");
      }

      ParameterCluster cluster;
      cluster.layer  = reader.parse<int32_t>(ct[0]);
      cluster.mltarr = ct[1];
      cluster.zonarr = ct[2];

      // The zone list ends at the first thing that isn't a number
      for (size_t i = 3; i < ct.size(); i++) {
        double as_double;
        if (!try_parse_double(ct[i], as_double)) {
          break;
        }
        int32_t iz;
        if (!try_parse_int(ct[i], iz)) {
          reader.fail("zone number '" + ct[i] + "' is not a valid integer");
        }
        if (iz != 0) {
          cluster.zones.push_back(iz);
        }
      }
      def.clusters.push_back(std::move(cluster));
    }

    definitions.push_back(std::move(def));
  }

  return ParameterSet(std::move(definitions));
}

void ParameterSet::write(std::ostream& out) const {
  for (const auto& def : definitions_) {
    out << fmt::format("{:<10} {:<4} {:>15} {:>5}\n", def.name, to_upper(def.type), def.value, def.clusters.size());
    for (const auto& cluster : def.clusters) {
      out << fmt::format("{:>10} {:<10} {:<10}", cluster.layer, to_upper(cluster.mltarr), to_upper(cluster.zonarr));
      for (const auto iz : cluster.zones) {
        out << fmt::format(" {:>5}", iz);
      }
      out << '\n';
    }
  }
}

bool ParameterSet::has_type(const std::string& type) const {
  return std::find(types_.begin(), types_.end(), to_lower(type)) != types_.end();
}

richdem::Array2D<float> ParameterSet::fill(const Model& model, const std::string& type, const int32_t k) const {
  richdem::Array2D<float> data(model.ncol(), model.nrow(), 0);
  const auto ptype = to_lower(type);

  for (const auto& def : definitions_) {
    if (def.type != ptype) {
      continue;
    }

    // A PVAL entry on the model overrides the value in the package file
    const double value = model.parameter_value(def.name).value_or(def.value);

    for (const auto& cluster : def.clusters) {
      if (cluster.layer != k + 1) {
        continue;
      }

      const richdem::Array2D<float>* mult = nullptr;
      if (cluster.mltarr != "none") {
        mult = &model.mult_array(cluster.mltarr);
      }

      const richdem::Array2D<int32_t>* zone = nullptr;
      if (cluster.zonarr != "all") {
        zone = &model.zone_array(cluster.zonarr);
      }

      for (int32_t y = 0; y < data.height(); y++) {
        for (int32_t x = 0; x < data.width(); x++) {
          if (zone && std::find(cluster.zones.begin(), cluster.zones.end(), (*zone)(x, y)) == cluster.zones.end()) {
            continue;
          }
          data(x, y) += static_cast<float>(value * (mult ? (*mult)(x, y) : 1.0));
        }
      }
    }
  }

  return data;
}

}  // namespace lpf
