#pragma once
#include <cstdint>
#include <optional>
#include <Eigen/Core>

namespace hamchain {

// Generalized coordinates and conjugate momenta of the chain.
struct State {
  Eigen::VectorXd q;
  Eigen::VectorXd p;

  Eigen::Index size() const { return q.size(); }
};

// q_i ~ N(0, 1) independently, p = 0. With a seed the draw is reproducible;
// without one the generator is seeded from std::random_device.
State make_initial_state(int n, std::optional<std::uint32_t> seed = std::nullopt);

// q = p = 0: a fixed point of every scheme.
State make_rest_state(int n);

// True when every entry of q and p is finite.
bool is_finite(const State& s);

} // namespace hamchain
