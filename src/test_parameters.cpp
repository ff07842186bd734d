#include "parameters.hpp"
#include "test_helpers.hpp"

#include <doctest/doctest.h>

#include <stdexcept>

using namespace lpf;

TEST_CASE("Reading a configuration file") {
  const TempDir tmp;
  const auto config = (tmp.path() / "lpf.cfg").string();

  SUBCASE("Full configuration") {
    tmp.write(
        "lpf.cfg",
        "# grid\n"
        "nrow 10\n"
        "ncol 20\n"
        "nlay 3\n"
        "nper 2\n"
        "steady 1 0\n"
        "laycbd 0 1 0\n"
        "model_ws /tmp/model\n"
        "model_name valley\n"
        "lpf_file valley.lpf\n"
        "check_level 0\n");

    const Parameters params(config);
    CHECK(params.nrow == 10);
    CHECK(params.ncol == 20);
    CHECK(params.nlay == 3);
    CHECK(params.steady == std::vector<int32_t>{1, 0});
    CHECK(params.laycbd == std::vector<int32_t>{0, 1, 0});
    CHECK(params.check_level == 0);
    CHECK(params.write_output == 0);
    CHECK(params.get_path("valley.lpf") == "/tmp/model/valley.lpf");
    CHECK(params.get_path("/data/other.lpf") == "/data/other.lpf");
  }

  SUBCASE("Flags default to steady periods without confining beds") {
    tmp.write("lpf.cfg", "nrow 1\nncol 1\nnlay 2\nnper 3\nmodel_name m\nlpf_file m.lpf\n");
    const Parameters params(config);
    CHECK(params.steady == std::vector<int32_t>{1, 1, 1});
    CHECK(params.laycbd == std::vector<int32_t>{0, 0});
  }

  SUBCASE("Unknown keys") {
    tmp.write("lpf.cfg", "nrow 1\nncol 1\nnlay 1\nmodel_name m\nlpf_file m.lpf\nsolver pcg\n");
    CHECK_THROWS_AS(Parameters{config}, std::runtime_error);
  }

  SUBCASE("Missing LPF file") {
    tmp.write("lpf.cfg", "nrow 1\nncol 1\nnlay 1\nmodel_name m\n");
    CHECK_THROWS_AS(Parameters{config}, std::runtime_error);
  }

  SUBCASE("Flags that don't match the grid") {
    tmp.write("lpf.cfg", "nrow 1\nncol 1\nnlay 2\nlaycbd 0\nmodel_name m\nlpf_file m.lpf\n");
    CHECK_THROWS_AS(Parameters{config}, std::runtime_error);
  }

  SUBCASE("No file at all") {
    CHECK_THROWS_AS(Parameters{(tmp.path() / "absent.cfg").string()}, std::runtime_error);
  }
}
