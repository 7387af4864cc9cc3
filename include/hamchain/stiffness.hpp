#pragma once
#include <Eigen/Sparse>

namespace hamchain {

// Column-major so the sparse LDLT in the implicit stepper can take it directly.
using Operator = Eigen::SparseMatrix<double>;

// First-difference matrix D (n x n): 1 on the diagonal, -1 on the subdiagonal,
// row 0 zeroed so coordinate 0 is pinned.
Operator difference_operator(int n);

// L = D^T * D. Symmetric positive semidefinite. n == 1 gives the 1x1 zero matrix.
// Throws Error{InvalidDimension} for n <= 0.
Operator build_stiffness(int n);

// L = D^T * diag(springs) * D with one spring constant per row of D.
// springs[0] multiplies the pinned (zero) row and has no effect.
Operator build_stiffness(int n, const Eigen::VectorXd& springs);

} // namespace hamchain
