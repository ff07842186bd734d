#include "layer_array.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>
#include <fmt/core.h>

#include <sstream>
#include <stdexcept>
#include <string>

using namespace lpf;
using richdem::Array2D;

namespace {

LayerArray<float> load_one(const std::string& text, const int32_t nrow, const int32_t ncol, const ArrayContext& ctx) {
  std::istringstream in(text);
  LineReader reader(in, "<test>");
  return LayerArray<float>::load(reader, nrow, ncol, "hk", ctx);
}

}  // namespace

TEST_CASE("Writing layer entries") {
  const ArrayContext ctx;

  SUBCASE("Uniform layer") {
    const LayerArray<float> layer("hk", 2, 3, 5.5f);
    std::ostringstream out;
    layer.write(out, ctx);
    CHECK(out.str() == fmt::format("CONSTANT{:>15} #hk\n", "5.5"));
  }

  SUBCASE("Grid layer wraps ten values to a line, each row on fresh lines") {
    Array2D<float> values(12, 2, 0.25f);
    values(11, 1) = 7;
    const LayerArray<float> layer("vka", values);

    std::ostringstream out;
    layer.write(out, ctx);
    const auto text = out.str();
    CHECK(text.rfind(fmt::format("INTERNAL{:>15} (FREE)   -1 #vka\n", "1"), 0) == 0);
    CHECK(CountOccurrences(text, "\n") == 5);
    CHECK(CountOccurrences(text, "0.25") == 23);
  }

  SUBCASE("Integer values are ten wide") {
    std::ostringstream out;
    write_layer_values(out, std::vector<int32_t>{1, 0, -1});
    CHECK(out.str() == "         1         0        -1\n");
  }
}

TEST_CASE("Reading layer entries") {
  ArrayContext ctx;
  ctx.unit_number = 15;

  SUBCASE("CONSTANT") {
    const auto layer = load_one("CONSTANT 3.5E-4 #hk\n", 2, 2, ctx);
    CHECK(layer.is_uniform());
    CHECK(layer(1, 1) == 3.5e-4f);
  }

  SUBCASE("INTERNAL applies its multiplier") {
    const auto layer = load_one("INTERNAL 2.0 (FREE) -1 #hk\n1 2 3\n4 5 6\n", 2, 3, ctx);
    CHECK(ArrayValuesEqual(layer.array(), Array2D<float>{{2, 4, 6}, {8, 10, 12}}));
  }

  SUBCASE("A zero multiplier leaves values alone") {
    const auto layer = load_one("INTERNAL 0 (FREE) -1\n1 2\n", 1, 2, ctx);
    CHECK(ArrayValuesEqual(layer.array(), Array2D<float>{{1, 2}}));
  }

  SUBCASE("Fixed-column record with LOCAT 0 is a constant") {
    const auto layer = load_one("         0      1.25 (10G12.4)     -1\n", 3, 3, ctx);
    CHECK(layer.is_uniform());
    CHECK(layer(2, 2) == 1.25f);
  }

  SUBCASE("Fixed-column record on the package's own unit reads inline values") {
    const auto layer = load_one("        15       1.0 (FREE)     -1\n1 2\n3 4\n", 2, 2, ctx);
    CHECK(ArrayValuesEqual(layer.array(), Array2D<float>{{1, 2}, {3, 4}}));
  }

  SUBCASE("Unformatted input is rejected") {
    CHECK_THROWS_AS(load_one("       -15       1.0 (FREE)     -1\n", 2, 2, ctx), std::runtime_error);
  }

  SUBCASE("Unknown control records are rejected") {
    CHECK_THROWS_AS(load_one("UNIFORM 1.0\n", 2, 2, ctx), std::runtime_error);
  }

  SUBCASE("Too few values") {
    CHECK_THROWS_AS(load_one("INTERNAL 1.0 (FREE) -1\n1 2\n", 2, 2, ctx), std::runtime_error);
  }
}

TEST_CASE("Layer entries kept in their own files") {
  const TempDir tmp;
  ArrayContext ctx;
  ctx.directory = tmp.path();

  SUBCASE("OPEN/CLOSE writes the values beside the package and reads them back") {
    Array2D<float> raw = {{1, 2, 3}, {4, 5, 6}};
    const LayerArray<float> layer(
        "hk", 2, 3, LayerArray<float>::Source(ExternalValues<float>{"hk_layer_1.ref", 10.0f, -1, raw}));
    CHECK(layer.is_external());
    CHECK(layer(2, 1) == 60.0f);

    std::ostringstream out;
    layer.write(out, ctx);
    CHECK(std::filesystem::exists(tmp.path() / "hk_layer_1.ref"));

    std::istringstream in(out.str());
    LineReader reader(in, "<test>");
    const auto reloaded = LayerArray<float>::load(reader, 2, 3, "hk", ctx);
    CHECK(reloaded.is_external());
    CHECK(ArrayValuesEqual(reloaded.array(), layer.array()));
    CHECK(std::get<ExternalValues<float>>(reloaded.source()).multiplier == 10.0f);
  }

  SUBCASE("EXTERNAL looks the unit up in the model's unit table") {
    tmp.write("kx.dat", "0.5 0.5\n0.5 0.5\n");
    ctx.external_units[40] = "kx.dat";
    const auto layer       = load_one("EXTERNAL 40 1.0 (FREE) -1\n", 2, 2, ctx);
    CHECK(ArrayValuesEqual(layer.array(), Array2D<float>(2, 2, 0.5f)));

    CHECK_THROWS_AS(load_one("EXTERNAL 41 1.0 (FREE) -1\n", 2, 2, ctx), std::runtime_error);
  }

  SUBCASE("A missing file is an error") {
    CHECK_THROWS_AS(load_one("OPEN/CLOSE nothing.ref 1.0 (FREE) -1\n", 2, 2, ctx), std::runtime_error);
  }
}

TEST_CASE("Layer shapes") {
  CHECK_THROWS_AS(
      LayerArray<float>("hk", 3, 3, LayerArray<float>::Source(GridValues<float>{Array2D<float>(2, 3, 1.0f), -1})),
      std::invalid_argument);

  SUBCASE("Broadcast scalars and per-layer lists") {
    const auto layers = FieldInput(std::vector<double>{1.0, 2.0}).resolve({"hk", "hk"}, 2, 2);
    REQUIRE(layers.size() == 2);
    CHECK(layers[1](0, 0) == 2.0f);
    CHECK_THROWS_AS(FieldInput(std::vector<double>{1.0}).resolve({"hk", "hk"}, 2, 2), std::invalid_argument);
    CHECK_THROWS_AS(
        FieldInput(std::vector<Array2D<float>>{Array2D<float>(3, 2, 0.0f)}).resolve({"hk"}, 2, 2),
        std::invalid_argument);
    CHECK_THROWS_AS(LayerInput<int32_t>(std::vector<int32_t>{1, 0, 1}).resolve("laytyp", 2), std::invalid_argument);
  }
}
