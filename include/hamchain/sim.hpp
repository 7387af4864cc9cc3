#pragma once
#include <array>
#include <cstddef>
#include <hamchain/config.hpp>
#include <hamchain/diagnostics.hpp>
#include <hamchain/energy.hpp>
#include <hamchain/integrators.hpp>
#include <hamchain/state.hpp>

namespace hamchain {

enum class Execution { Sequential, Parallel };

// Energy trajectories of every scheme from one shared initial condition.
struct Comparison {
  double dt = 0.0;
  std::size_t num_steps = 0;
  std::array<Trajectory, static_cast<std::size_t>(Scheme::Count)> trajectories{};

  const Trajectory& of(Scheme s) const { return trajectories[static_cast<std::size_t>(s)]; }
  Trajectory& of(Scheme s) { return trajectories[static_cast<std::size_t>(s)]; }
};

// Copies initial, then for each of num_steps steps: advance, record H(q, p).
// num_steps above kMaxSteps is Error{InvalidParameter}.
Trajectory run(const State& initial, double dt, std::size_t num_steps,
               const EnergyModel& model, Scheme scheme);

// Same loop with a caller-owned integrator (its cached state carries over).
Trajectory run(const State& initial, double dt, std::size_t num_steps,
               const EnergyModel& model, Integrator& integrator);

// One independent run per scheme. Parallel uses one thread per scheme; the
// model is shared read-only and results match the sequential mode exactly.
// The first worker error is re-thrown on the calling thread.
Comparison run_all(const State& initial, double dt, std::size_t num_steps,
                   const EnergyModel& model,
                   Execution exec = Execution::Sequential);

// Validates params, builds L and the seeded initial condition, runs all schemes.
Comparison simulate(const Params& params, Execution exec = Execution::Sequential);

} // namespace hamchain
