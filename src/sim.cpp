#include <hamchain/sim.hpp>
#include <exception>
#include <thread>
#include <string>
#include <vector>
#include <hamchain/error.hpp>

namespace hamchain {

Trajectory run(const State& initial, double dt, std::size_t num_steps,
               const EnergyModel& model, Integrator& integrator) {
  model.check_state(initial);
  if (num_steps > kMaxSteps) {
    throw Error(ErrorKind::InvalidParameter,
                "num_steps " + std::to_string(num_steps) + " exceeds " + std::to_string(kMaxSteps));
  }
  State s = initial; // private copy; the caller's state is never touched

  Trajectory traj;
  traj.reserve(num_steps);
  for (std::size_t k = 0; k < num_steps; ++k) {
    integrator.step(s, dt);
    traj.push_back(model.kinetic_energy(s.p) + model.potential_energy(s.q));
  }
  return traj;
}

Trajectory run(const State& initial, double dt, std::size_t num_steps,
               const EnergyModel& model, Scheme scheme) {
  auto integrator = make_integrator(scheme, model);
  return run(initial, dt, num_steps, model, *integrator);
}

Comparison run_all(const State& initial, double dt, std::size_t num_steps,
                   const EnergyModel& model, Execution exec) {
  Comparison out;
  out.dt = dt;
  out.num_steps = num_steps;

  if (exec == Execution::Sequential) {
    for (Scheme s : kAllSchemes) out.of(s) = run(initial, dt, num_steps, model, s);
    return out;
  }

  std::array<std::exception_ptr, kAllSchemes.size()> errors{};
  std::vector<std::thread> workers;
  workers.reserve(kAllSchemes.size());
  auto join_all = [&workers]{
    for (auto& th : workers) if (th.joinable()) th.join();
  };

  try {
    for (std::size_t i = 0; i < kAllSchemes.size(); ++i) {
      workers.emplace_back([&, i]{
        try {
          out.trajectories[i] = run(initial, dt, num_steps, model, kAllSchemes[i]);
        } catch (...) {
          errors[i] = std::current_exception();
        }
      });
    }
  } catch (...) {
    join_all(); // thread creation failed; do not leave joinable threads behind
    throw;
  }
  join_all();

  for (const auto& e : errors) {
    if (e) std::rethrow_exception(e);
  }
  return out;
}

Comparison simulate(const Params& params, Execution exec) {
  validate(params);
  const EnergyModel model(build_stiffness(params.n));
  const State initial = make_initial_state(params.n, params.seed);
  return run_all(initial, params.dt, num_steps(params), model, exec);
}

} // namespace hamchain
