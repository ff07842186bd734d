#include "lpf_package.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>
#include <fmt/core.h>

#include <sstream>
#include <string>

using namespace lpf;
using richdem::Array2D;

namespace {

bool has_line(const std::string& text, const std::string& line) {
  return text.find(line + "\n") != std::string::npos;
}

// Layer k of a 4x5 grid filled with `fill`, except for one cell
std::vector<Array2D<float>> grids_with(
    const float fill,
    const int32_t k,
    const int32_t x,
    const int32_t y,
    const float bad) {
  std::vector<Array2D<float>> grids(2, Array2D<float>(5, 4, fill));
  grids[k](x, y) = bad;
  return grids;
}

}  // namespace

TEST_CASE("Valid data passes") {
  Model model("check", 4, 5, 2, 1);
  const auto lpf = LpfPackage::create(model);

  const auto result = lpf->check(nullptr, false);
  CHECK_FALSE(result.errors);
  CHECK(result.text.rfind("\nLPF PACKAGE DATA VALIDATION:\n", 0) == 0);
  CHECK(has_line(result.text, "  Specified horizontal hydraulic conductivity is OK."));
  CHECK(has_line(result.text, "  Specified vertical hydraulic conductivity is OK."));
  CHECK(result.text.find("ratio") == std::string::npos);
  CHECK(result.text.find("confining bed") == std::string::npos);
  CHECK(result.text.find("specific storage") == std::string::npos);
  CHECK(result.text.find("DETAILED SUMMARY") == std::string::npos);
}

TEST_CASE("Negative horizontal conductivity") {
  Model model("check", 4, 5, 2, 1);
  LpfSettings settings;
  settings.hk    = grids_with(1.0f, 1, 3, 2, -1.5f);
  const auto lpf = LpfPackage::create(model, settings);

  SUBCASE("Detailed report names the cell") {
    std::ostringstream report;
    const auto result = lpf->check(&report, false, 1);

    CHECK(result.errors);
    CHECK(has_line(result.text, "  ERROR: Negative horizontal hydraulic conductivity specified."));
    CHECK(has_line(result.text, "  Specified vertical hydraulic conductivity is OK."));
    CHECK(has_line(result.text, "\n  DETAILED SUMMARY OF LPF ERRORS:"));
    CHECK(result.text.find(fmt::format("    {:>10}{:>10}{:>10}{:>15}\n", "layer", "row", "column", "hk")) !=
          std::string::npos);
    CHECK(result.text.find(fmt::format("    {:10d}{:10d}{:10d}{:15.7g}\n", 2, 3, 4, -1.5f)) != std::string::npos);
    CHECK(report.str() == result.text + "\n");
  }

  SUBCASE("Summary only at level 0") {
    const auto result = lpf->check(nullptr, false, 0);
    CHECK(result.errors);
    CHECK(has_line(result.text, "  ERROR: Negative horizontal hydraulic conductivity specified."));
    CHECK(result.text.find("DETAILED SUMMARY") == std::string::npos);
  }

  SUBCASE("Inactive cells are not checked") {
    Array2D<int32_t> ibound(5, 4, 1);
    ibound(3, 2) = 0;
    model.set_ibound(1, ibound);
    CHECK_FALSE(lpf->check(nullptr, false).errors);
  }

  SUBCASE("Checking twice gives the same answer and changes nothing") {
    const auto before = lpf->hk;
    const auto first  = lpf->check(nullptr, false);
    const auto second = lpf->check(nullptr, false);
    CHECK(first.text == second.text);
    CHECK(first.errors == second.errors);
    CHECK(LayersEqual(lpf->hk, before));
    CHECK(lpf->hk[1](3, 2) == -1.5f);
  }
}

TEST_CASE("Vertical conductivity must be positive") {
  Model model("check", 4, 5, 2, 1);
  LpfSettings settings;
  settings.vka      = grids_with(1.0f, 0, 0, 0, 0.0f);
  const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
  CHECK(result.errors);
  CHECK(has_line(result.text, "  ERROR: Negative or zero vertical hydraulic conductivity specified."));
  CHECK(result.text.find(fmt::format("    {:10d}{:10d}{:10d}{:15.7g}\n", 1, 1, 1, 0.0f)) != std::string::npos);
}

TEST_CASE("Anisotropy is only checked where it is read per cell") {
  Model model("check", 4, 5, 2, 1);
  LpfSettings settings;
  settings.hani = grids_with(1.0f, 0, 1, 1, -2.0f);

  SUBCASE("Layer uses a scalar ratio") {
    settings.chani    = std::vector<float>{1.0f, 1.0f};
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK_FALSE(result.errors);
  }

  SUBCASE("Layer reads a ratio array") {
    settings.chani    = std::vector<float>{-1.0f, 1.0f};
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK(result.errors);
    CHECK(has_line(result.text, "  ERROR: Negative horizontal hydraulic conductivity ratio specified."));
  }
}

TEST_CASE("Confining bed conductivity") {
  Model model("check", 4, 5, 2, 1);
  LpfSettings settings;
  settings.vkcb = grids_with(0.0f, 0, 4, 3, -0.1f);

  SUBCASE("No confining bed below the layer") {
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK_FALSE(result.errors);
  }

  SUBCASE("Confining bed below the layer") {
    model.set_laycbd({1, 0});
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK(result.errors);
    CHECK(has_line(result.text, "  ERROR: Negative quasi-3D confining bed vertical hydraulic conductivity specified."));
    CHECK(result.text.find(fmt::format("    {:10d}{:10d}{:10d}{:15.7g}\n", 1, 4, 5, -0.1f)) != std::string::npos);
  }
}

TEST_CASE("Storage is only checked for transient models") {
  LpfSettings settings;
  settings.laytyp = std::vector<int32_t>{0, 1};
  settings.ss     = grids_with(1e-5f, 0, 2, 2, -1e-5f);
  settings.sy     = grids_with(0.2f, 0, 2, 2, -0.2f);

  SUBCASE("Steady state") {
    Model model("check", 4, 5, 2, 1);
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK_FALSE(result.errors);
    CHECK(result.text.find("specific") == std::string::npos);
  }

  SUBCASE("Transient") {
    Model model("check", 4, 5, 2, 2);
    model.set_steady({true, false});
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK(result.errors);
    CHECK(has_line(result.text, "  ERROR: Negative specific storage specified."));
    // The bad specific yield sits in a confined layer, where it isn't used
    CHECK(has_line(result.text, "  Specified specific yield is OK."));
  }

  SUBCASE("Transient with a convertible layer") {
    Model model("check", 4, 5, 2, 2);
    model.set_steady({true, false});
    settings.laytyp   = std::vector<int32_t>{1, 1};
    const auto result = LpfPackage::create(model, settings)->check(nullptr, false);
    CHECK(has_line(result.text, "  ERROR: Negative specific yield specified."));
  }
}
