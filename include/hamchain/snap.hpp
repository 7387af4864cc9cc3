#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <hamchain/diagnostics.hpp>
#include <hamchain/integrators.hpp>

namespace hamchain {

// Immutable view of a background comparison run, published for the viewer.
struct RunSnapshot {
  std::uint64_t tick = 0;        // publish index
  std::uint64_t generation = 0;  // bumped on every restart
  int n = 0;
  double dt = 0.0;
  std::size_t step = 0;          // steps completed by every scheme
  std::size_t num_steps = 0;
  bool finished = false;
  std::string error;             // set if the run failed; finished is then true
  std::array<Trajectory, static_cast<std::size_t>(Scheme::Count)> trajectories{};

  const Trajectory& of(Scheme s) const { return trajectories[static_cast<std::size_t>(s)]; }
};

} // namespace hamchain
