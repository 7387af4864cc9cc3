#include <cstdio>
#include <string>
#include <vector>
#include <hamchain/config.hpp>
#include <hamchain/error.hpp>
#include <hamchain/sim_runner.hpp>
#include <hamchain/viewer/app.hpp>

using namespace hamchain;

int main(int argc, char** argv) {
  Params params;
  try {
    params = params_from_args(std::vector<std::string>(argv + 1, argv + argc));
    if (!params.seed) params.seed = 0;
    validate(params);
  } catch (const Error& e) {
    std::fprintf(stderr, "hamchain_viewer: %s\n", e.what());
    return 2;
  }

  SimRunner sim;
  sim.configure(params);
  sim.start();

  ViewerApp app(sim, params);
  const int code = app.run();

  sim.stop();
  return code;
}
