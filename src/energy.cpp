#include <hamchain/energy.hpp>
#include <string>
#include <utility>
#include <hamchain/error.hpp>

namespace hamchain {

EnergyModel::EnergyModel(Operator L) : L_(std::move(L)) {
  if (L_.rows() <= 0 || L_.rows() != L_.cols()) {
    throw Error(ErrorKind::InvalidDimension,
                "stiffness operator must be square and non-empty, got " +
                std::to_string(L_.rows()) + "x" + std::to_string(L_.cols()));
  }
  L_.makeCompressed();
}

void EnergyModel::check_length_(const Eigen::VectorXd& v, const char* what) const {
  if (v.size() != dimension()) {
    throw Error(ErrorKind::DimensionMismatch,
                std::string(what) + " has length " + std::to_string(v.size()) +
                ", expected " + std::to_string(dimension()));
  }
}

void EnergyModel::check_state(const State& s) const {
  check_length_(s.q, "q");
  check_length_(s.p, "p");
}

double EnergyModel::kinetic_energy(const Eigen::VectorXd& p) const {
  check_length_(p, "p");
  return 0.5 * p.squaredNorm();
}

double EnergyModel::potential_energy(const Eigen::VectorXd& q) const {
  check_length_(q, "q");
  const Eigen::VectorXd Lq = L_ * q;
  return 0.5 * q.dot(Lq);
}

double EnergyModel::total_energy(const State& s) const {
  return kinetic_energy(s.p) + potential_energy(s.q);
}

Eigen::VectorXd EnergyModel::potential_gradient(const Eigen::VectorXd& q) const {
  check_length_(q, "q");
  return L_ * q;
}

Eigen::VectorXd EnergyModel::velocity(const Eigen::VectorXd& p) const {
  check_length_(p, "p");
  return p;
}

} // namespace hamchain
