#pragma once
#include <Eigen/Core>
#include <hamchain/state.hpp>
#include <hamchain/stiffness.hpp>

namespace hamchain {

// Separable Hamiltonian H(q, p) = 0.5 p.p + 0.5 q^T L q with unit masses.
// Immutable once built; one instance may be shared read-only by any number
// of concurrent runs.
class EnergyModel {
public:
  explicit EnergyModel(Operator L);

  Eigen::Index dimension() const { return L_.rows(); }
  const Operator& stiffness() const { return L_; }

  double kinetic_energy(const Eigen::VectorXd& p) const;
  double potential_energy(const Eigen::VectorXd& q) const;
  double total_energy(const State& s) const;

  // dV/dq = L q
  Eigen::VectorXd potential_gradient(const Eigen::VectorXd& q) const;
  // dT/dp = p
  Eigen::VectorXd velocity(const Eigen::VectorXd& p) const;

  // Throws Error{DimensionMismatch} if q or p does not have length n.
  void check_state(const State& s) const;

private:
  void check_length_(const Eigen::VectorXd& v, const char* what) const;

  Operator L_;
};

} // namespace hamchain
