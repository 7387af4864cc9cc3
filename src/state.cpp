#include <hamchain/state.hpp>
#include <random>
#include <string>
#include <hamchain/error.hpp>

namespace hamchain {

static void require_dimension(int n) {
  if (n <= 0) {
    throw Error(ErrorKind::InvalidDimension,
                "system size must be positive, got " + std::to_string(n));
  }
}

State make_initial_state(int n, std::optional<std::uint32_t> seed) {
  require_dimension(n);
  std::mt19937 rng(seed.has_value() ? *seed : std::random_device{}());
  std::normal_distribution<double> N(0.0, 1.0);

  State s;
  s.q.resize(n);
  for (int i = 0; i < n; ++i) s.q[i] = N(rng);
  s.p = Eigen::VectorXd::Zero(n);
  return s;
}

State make_rest_state(int n) {
  require_dimension(n);
  return State{Eigen::VectorXd::Zero(n), Eigen::VectorXd::Zero(n)};
}

bool is_finite(const State& s) {
  return s.q.allFinite() && s.p.allFinite();
}

} // namespace hamchain
