#pragma once

#include "file_reader.hpp"

#include <fmt/core.h>
#include <richdem/common/Array2D.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace lpf {

/// Where array entries that live in their own files are read from and written
/// to, and how old-style unit numbers map onto those files.
struct ArrayContext {
  std::filesystem::path directory = ".";
  std::map<int32_t, std::string> external_units;  // EXTERNAL unit -> file name
  int32_t unit_number = 0;                        // unit of the package file itself
};

template <class T>
struct UniformValue {
  T value = 0;
};

template <class T>
struct GridValues {
  richdem::Array2D<T> values;
  int32_t iprn = -1;
};

// `values` holds the file contents before `multiplier` is applied, so that the
// file can be written back unchanged.
template <class T>
struct ExternalValues {
  std::string filename;
  T multiplier = 1;
  int32_t iprn = -1;
  richdem::Array2D<T> values;
};

template <class T>
constexpr int value_width() {
  return std::is_integral_v<T> ? 10 : 15;
}

// Floats are written in their shortest round-trip form so reading a file back
// gives the same bits. Always leaves at least one blank in front of the value.
template <class T>
std::string format_value(const T value) {
  return fmt::format(" {:>{}}", value, value_width<T>() - 1);
}

template <class T>
void write_grid_values(std::ostream& out, const richdem::Array2D<T>& values) {
  for (int32_t y = 0; y < values.height(); y++) {
    for (int32_t x = 0; x < values.width(); x++) {
      out << format_value(values(x, y));
      if ((x + 1) % 10 == 0 || x + 1 == values.width()) {
        out << '\n';
      }
    }
  }
}

// Each row starts on a fresh line, as a free-format Fortran read would expect
template <class T>
richdem::Array2D<T> read_grid_values(LineReader& reader, const int32_t nrow, const int32_t ncol) {
  richdem::Array2D<T> values(ncol, nrow, 0);
  for (int32_t y = 0; y < nrow; y++) {
    const auto row = reader.read_values<T>(ncol);
    for (int32_t x = 0; x < ncol; x++) {
      values(x, y) = row[x];
    }
  }
  return values;
}

/// Per-layer control values (LAYTYP, CHANI, ...). Written as plain values, ten
/// to a line, with no control record.
template <class T>
void write_layer_values(std::ostream& out, const std::vector<T>& values) {
  for (size_t k = 0; k < values.size(); k++) {
    out << format_value(values[k]);
    if ((k + 1) % 10 == 0 || k + 1 == values.size()) {
      out << '\n';
    }
  }
}

template <class T>
std::vector<T> read_layer_values(LineReader& reader, const int32_t nlay) {
  return reader.read_values<T>(nlay);
}

/// The values of one model layer for one property, together with the name
/// the layer is tagged with in the package file. A layer is a single value
/// applied to every cell, a full grid, or a grid kept in an external file.
template <class T>
class LayerArray {
 public:
  using Source = std::variant<UniformValue<T>, GridValues<T>, ExternalValues<T>>;

  LayerArray() = default;
  LayerArray(std::string name, const int32_t nrow, const int32_t ncol, const T value);
  LayerArray(std::string name, richdem::Array2D<T> values);
  LayerArray(std::string name, const int32_t nrow, const int32_t ncol, Source source);

  const std::string& name() const { return name_; }
  int32_t nrow() const { return nrow_; }
  int32_t ncol() const { return ncol_; }
  const Source& source() const { return source_; }

  bool is_uniform() const { return std::holds_alternative<UniformValue<T>>(source_); }
  bool is_external() const { return std::holds_alternative<ExternalValues<T>>(source_); }

  LayerArray renamed(std::string name) const;

  /// Value at column x, row y
  T operator()(const int32_t x, const int32_t y) const;

  richdem::Array2D<T> array() const;

  void write(std::ostream& out, const ArrayContext& context) const;

  static LayerArray load(
      LineReader& reader,
      const int32_t nrow,
      const int32_t ncol,
      const std::string& name,
      const ArrayContext& context);

 private:
  void check_shape(const richdem::Array2D<T>& values) const;

  std::string name_;
  int32_t nrow_ = 0;
  int32_t ncol_ = 0;
  Source source_;
};

template <class T>
LayerArray<T>::LayerArray(std::string name, const int32_t nrow, const int32_t ncol, const T value)
    : name_(std::move(name)), nrow_(nrow), ncol_(ncol), source_(UniformValue<T>{value}) {}

template <class T>
LayerArray<T>::LayerArray(std::string name, richdem::Array2D<T> values)
    : name_(std::move(name)), nrow_(values.height()), ncol_(values.width()) {
  source_ = GridValues<T>{std::move(values), -1};
}

template <class T>
LayerArray<T>::LayerArray(std::string name, const int32_t nrow, const int32_t ncol, Source source)
    : name_(std::move(name)), nrow_(nrow), ncol_(ncol), source_(std::move(source)) {
  if (const auto* grid = std::get_if<GridValues<T>>(&source_)) {
    check_shape(grid->values);
  } else if (const auto* external = std::get_if<ExternalValues<T>>(&source_)) {
    check_shape(external->values);
  }
}

template <class T>
void LayerArray<T>::check_shape(const richdem::Array2D<T>& values) const {
  if (values.width() != ncol_ || values.height() != nrow_) {
    throw std::invalid_argument(fmt::format(
        "Array '{}' is {}x{} but the layer is {} rows by {} columns!",
        name_,
        values.height(),
        values.width(),
        nrow_,
        ncol_));
  }
}

template <class T>
LayerArray<T> LayerArray<T>::renamed(std::string name) const {
  auto copy  = *this;
  copy.name_ = std::move(name);
  return copy;
}

template <class T>
T LayerArray<T>::operator()(const int32_t x, const int32_t y) const {
  if (const auto* uniform = std::get_if<UniformValue<T>>(&source_)) {
    return uniform->value;
  } else if (const auto* grid = std::get_if<GridValues<T>>(&source_)) {
    return grid->values(x, y);
  }
  const auto& external = std::get<ExternalValues<T>>(source_);
  if (external.multiplier == 0) {
    return external.values(x, y);
  }
  return external.values(x, y) * external.multiplier;
}

template <class T>
richdem::Array2D<T> LayerArray<T>::array() const {
  richdem::Array2D<T> values(ncol_, nrow_, 0);
  for (int32_t y = 0; y < nrow_; y++) {
    for (int32_t x = 0; x < ncol_; x++) {
      values(x, y) = (*this)(x, y);
    }
  }
  return values;
}

template <class T>
void LayerArray<T>::write(std::ostream& out, const ArrayContext& context) const {
  if (const auto* uniform = std::get_if<UniformValue<T>>(&source_)) {
    out << fmt::format("CONSTANT{} #{}\n", format_value(uniform->value), name_);
    return;
  }

  if (const auto* grid = std::get_if<GridValues<T>>(&source_)) {
    out << fmt::format("INTERNAL{} (FREE) {:>4} #{}\n", format_value(T(1)), grid->iprn, name_);
    write_grid_values(out, grid->values);
    return;
  }

  const auto& external = std::get<ExternalValues<T>>(source_);
  out << fmt::format(
      "OPEN/CLOSE {}{} (FREE) {:>4} #{}\n", external.filename, format_value(external.multiplier), external.iprn, name_);

  const auto path = context.directory / external.filename;
  std::ofstream fout(path);
  if (!fout.good()) {
    throw std::runtime_error("Failed to open external array file '" + path.string() + "' for writing!");
  }
  write_grid_values(fout, external.values);
  if (!fout.good()) {
    throw std::runtime_error("Failed to write external array file '" + path.string() + "'!");
  }
}

template <class T>
ExternalValues<T> read_external_values(
    const std::filesystem::path& path,
    const std::string& filename,
    const T multiplier,
    const int32_t iprn,
    const int32_t nrow,
    const int32_t ncol) {
  std::ifstream fin(path);
  if (!fin.good()) {
    throw std::runtime_error("Failed to open external array file '" + path.string() + "'!");
  }
  LineReader reader(fin, path.string());
  return ExternalValues<T>{filename, multiplier, iprn, read_grid_values<T>(reader, nrow, ncol)};
}

template <class T>
LayerArray<T> LayerArray<T>::load(
    LineReader& reader,
    const int32_t nrow,
    const int32_t ncol,
    const std::string& name,
    const ArrayContext& context) {
  const auto tokens = reader.next_tokens();
  if (tokens.empty()) {
    reader.fail("expected an array control record for '" + name + "' but found a blank line");
  }

  const auto token_at = [&](const size_t i) -> const std::string& {
    if (i >= tokens.size()) {
      reader.fail("array control record for '" + name + "' is missing fields");
    }
    return tokens[i];
  };

  // The print code is optional and only kept so that it can be written back
  const auto print_code = [&](const size_t i) {
    int32_t iprn = -1;
    if (i < tokens.size() && !try_parse_int(tokens[i], iprn)) {
      iprn = -1;
    }
    return iprn;
  };

  const auto apply_multiplier = [](richdem::Array2D<T>& values, const T cnstnt) {
    if (cnstnt == 0 || cnstnt == 1) {
      return;
    }
    for (int32_t y = 0; y < values.height(); y++) {
      for (int32_t x = 0; x < values.width(); x++) {
        values(x, y) *= cnstnt;
      }
    }
  };

  const auto external_unit_file = [&](const int32_t unit) -> const std::string& {
    const auto found = context.external_units.find(unit);
    if (found == context.external_units.end()) {
      reader.fail(fmt::format("array '{}' refers to unit {}, which has no file attached", name, unit));
    }
    return found->second;
  };

  const auto keyword = to_upper(tokens[0]);

  if (keyword == "CONSTANT") {
    return LayerArray(name, nrow, ncol, UniformValue<T>{reader.parse<T>(token_at(1))});
  }

  if (keyword == "INTERNAL") {
    const auto cnstnt = reader.parse<T>(token_at(1));
    GridValues<T> grid{read_grid_values<T>(reader, nrow, ncol), print_code(3)};
    apply_multiplier(grid.values, cnstnt);
    return LayerArray(name, nrow, ncol, Source(std::move(grid)));
  }

  if (keyword == "OPEN/CLOSE") {
    const auto& filename = token_at(1);
    const auto cnstnt    = reader.parse<T>(token_at(2));
    return LayerArray(
        name,
        nrow,
        ncol,
        Source(read_external_values<T>(context.directory / filename, filename, cnstnt, print_code(4), nrow, ncol)));
  }

  if (keyword == "EXTERNAL") {
    const auto& filename = external_unit_file(reader.parse<int32_t>(token_at(1)));
    const auto cnstnt    = reader.parse<T>(token_at(2));
    return LayerArray(
        name,
        nrow,
        ncol,
        Source(read_external_values<T>(context.directory / filename, filename, cnstnt, print_code(4), nrow, ncol)));
  }

  // Fixed-column control record: LOCAT CNSTNT FMTIN IPRN
  int32_t locat;
  if (!try_parse_int(tokens[0], locat)) {
    reader.fail("unrecognised array control record '" + tokens[0] + "' for '" + name + "'");
  }
  const auto cnstnt = reader.parse<T>(token_at(1));

  if (locat == 0) {
    return LayerArray(name, nrow, ncol, UniformValue<T>{cnstnt});
  } else if (locat < 0) {
    reader.fail("unformatted array input is not supported ('" + name + "')");
  } else if (locat == context.unit_number) {
    GridValues<T> grid{read_grid_values<T>(reader, nrow, ncol), print_code(3)};
    apply_multiplier(grid.values, cnstnt);
    return LayerArray(name, nrow, ncol, Source(std::move(grid)));
  }

  const auto& filename = external_unit_file(locat);
  return LayerArray(
      name,
      nrow,
      ncol,
      Source(read_external_values<T>(context.directory / filename, filename, cnstnt, print_code(3), nrow, ncol)));
}

/// One value per layer, either given once for every layer or listed layer by
/// layer.
template <class T>
class LayerInput {
 public:
  LayerInput(const T value) : values_(1, value), broadcast_(true) {}
  LayerInput(std::vector<T> values) : values_(std::move(values)) {}

  std::vector<T> resolve(const std::string& name, const int32_t nlay) const {
    if (broadcast_) {
      return std::vector<T>(nlay, values_.front());
    }
    if (values_.size() != static_cast<size_t>(nlay)) {
      throw std::invalid_argument(
          fmt::format("{} has {} values but the model has {} layers!", name, values_.size(), nlay));
    }
    return values_;
  }

 private:
  std::vector<T> values_;
  bool broadcast_ = false;
};

/// Value of a three-dimensional property as it is handed to a package: one
/// value for every cell, one value per layer, one grid per layer, or layers
/// that are already built.
class FieldInput {
 public:
  FieldInput(const double value);
  FieldInput(std::vector<double> layer_values);
  FieldInput(std::vector<richdem::Array2D<float>> layer_grids);
  FieldInput(std::vector<LayerArray<float>> layers);

  /// Build one layer per entry of `names`, each tagged with its name
  std::vector<LayerArray<float>> resolve(
      const std::vector<std::string>& names,
      const int32_t nrow,
      const int32_t ncol) const;

 private:
  std::variant<double, std::vector<double>, std::vector<richdem::Array2D<float>>, std::vector<LayerArray<float>>>
      value_;
};

}  // namespace lpf
