#include "lpf_package.hpp"
#include "parameters.hpp"

#include <richdem/common/timer.hpp>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace lpf;

std::string get_current_time_and_date_as_str() {
  const auto now       = std::chrono::system_clock::now();
  const auto in_time_t = std::chrono::system_clock::to_time_t(now);

  std::stringstream ss;
  ss << std::put_time(std::localtime(&in_time_t), "%Y-%m-%d %H:%M:%S");
  return ss.str();
}

// IBOUND is given as one array per layer, in any of the forms a package file
// accepts ("CONSTANT 1", "INTERNAL 1 (FREE) -1" plus values, ...)
void read_ibound(const Parameters& params, Model& model) {
  const auto path = params.get_path(params.ibound_file);
  std::ifstream fin(path);
  if (!fin.good()) {
    throw std::runtime_error("Failed to open IBOUND file '" + path + "'!");
  }

  LineReader reader(fin, path);
  const auto context = model.array_context();
  for (int32_t k = 0; k < model.nlay(); k++) {
    const auto ibound = LayerArray<int32_t>::load(reader, model.nrow(), model.ncol(), "ibound", context);
    model.set_ibound(k, ibound.array());
  }
}

std::unique_ptr<Model> initialise(const Parameters& params) {
  auto model =
      std::make_unique<Model>(params.model_name, params.nrow, params.ncol, params.nlay, params.nper, params.model_ws);
  model->set_verbose(params.verbose != 0);
  model->set_steady(std::vector<bool>(params.steady.begin(), params.steady.end()));
  model->set_laycbd(params.laycbd);

  if (!params.ibound_file.empty()) {
    std::cout << "p reading IBOUND from '" << params.ibound_file << "'..." << std::endl;
    read_ibound(params, *model);
  }

  return model;
}

bool run(const Parameters& params, Model& model) {
  richdem::Timer timer_load;
  timer_load.start();

  const auto lpf = LpfPackage::load(params.get_path(params.lpf_file), model, false);

  std::cerr << "t Load time = " << timer_load.lap() << std::endl;

  richdem::Timer timer_check;
  timer_check.start();

  const auto chk_path = model.model_ws() / (lpf->package_type() + ".chk");
  std::ofstream chk(chk_path);
  if (!chk.good()) {
    throw std::runtime_error("Failed to open check file '" + chk_path.string() + "'!");
  }
  const auto result = lpf->check(&chk, model.verbose(), params.check_level);

  std::cerr << "t Check time = " << timer_check.lap() << std::endl;

  if (params.write_output) {
    richdem::Timer timer_write;
    timer_write.start();

    std::cout << "p writing '" << lpf->file_path().string() << "'..." << std::endl;
    lpf->write_file(false);

    std::cerr << "t Write time = " << timer_write.lap() << std::endl;
  }

  return !result.errors;
}

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Syntax: " << argv[0] << " <Configuration File>" << std::endl;
    return -1;
  }

  try {
    std::cerr << "Reading configuration file '" << argv[1] << "'..." << std::endl;
    const Parameters params(argv[1]);
    params.print();

    std::cerr << "t Start time: " << get_current_time_and_date_as_str() << std::endl;

    const auto model = initialise(params);
    const bool ok    = run(params, *model);

    std::cerr << "t Done time: " << get_current_time_and_date_as_str() << std::endl;

    if (!ok) {
      std::cerr << "LPF data failed validation, see " << (model->model_ws() / "LPF.chk").string() << std::endl;
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  }

  return 0;
}
