#include <hamchain/stiffness.hpp>
#include <cmath>
#include <string>
#include <vector>
#include <hamchain/error.hpp>

namespace hamchain {

static void require_dimension(int n) {
  if (n <= 0) {
    throw Error(ErrorKind::InvalidDimension,
                "system size must be positive, got " + std::to_string(n));
  }
}

Operator difference_operator(int n) {
  require_dimension(n);
  std::vector<Eigen::Triplet<double>> entries;
  entries.reserve(2 * static_cast<std::size_t>(n));
  // Row 0 stays empty: that coordinate is pinned.
  for (int i = 1; i < n; ++i) {
    entries.emplace_back(i, i, 1.0);
    entries.emplace_back(i, i - 1, -1.0);
  }
  Operator D(n, n);
  D.setFromTriplets(entries.begin(), entries.end());
  D.makeCompressed();
  return D;
}

Operator build_stiffness(int n) {
  const Operator D = difference_operator(n);
  Operator L = Operator(D.transpose()) * D;
  L.makeCompressed();
  return L;
}

Operator build_stiffness(int n, const Eigen::VectorXd& springs) {
  require_dimension(n);
  if (springs.size() != n) {
    throw Error(ErrorKind::DimensionMismatch,
                "expected " + std::to_string(n) + " spring constants, got " +
                std::to_string(springs.size()));
  }
  for (Eigen::Index i = 0; i < springs.size(); ++i) {
    if (!std::isfinite(springs[i]) || springs[i] < 0.0) {
      throw Error(ErrorKind::InvalidParameter,
                  "spring constant " + std::to_string(i) + " must be finite and >= 0");
    }
  }

  const Operator D = difference_operator(n);
  std::vector<Eigen::Triplet<double>> diag;
  diag.reserve(static_cast<std::size_t>(n));
  for (int i = 0; i < n; ++i) diag.emplace_back(i, i, springs[i]);
  Operator W(n, n);
  W.setFromTriplets(diag.begin(), diag.end());

  Operator L = Operator(D.transpose()) * (W * D);
  L.makeCompressed();
  return L;
}

} // namespace hamchain
