#include <hamchain/diagnostics.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <hamchain/error.hpp>

namespace hamchain {

static void require_non_empty(const Trajectory& traj) {
  if (traj.empty()) throw Error(ErrorKind::EmptyTrajectory, "trajectory has no samples");
}

static double mean_of(const Trajectory& traj) {
  const double sum = std::accumulate(traj.begin(), traj.end(), 0.0);
  return sum / static_cast<double>(traj.size());
}

double conservation_error(const Trajectory& traj) {
  require_non_empty(traj);
  const auto [lo, hi] = std::minmax_element(traj.begin(), traj.end());
  const double mean = mean_of(traj);
  if (std::fabs(mean) < kDegenerateMeanEps) {
    throw Error(ErrorKind::DegenerateMean, "mean energy is zero");
  }
  return (*hi - *lo) / mean;
}

double relative_drift(const Trajectory& traj) {
  require_non_empty(traj);
  const double first = traj.front();
  if (std::fabs(first) < kDegenerateMeanEps) {
    throw Error(ErrorKind::DegenerateMean, "initial energy is zero");
  }
  return (traj.back() - first) / first;
}

EnergySummary summarize(const Trajectory& traj) {
  require_non_empty(traj);
  const auto [lo, hi] = std::minmax_element(traj.begin(), traj.end());
  EnergySummary s;
  s.first = traj.front();
  s.last  = traj.back();
  s.min   = *lo;
  s.max   = *hi;
  s.mean  = mean_of(traj);
  s.conservation_error = conservation_error(traj);
  s.drift = relative_drift(traj);
  return s;
}

bool is_non_decreasing(const Trajectory& traj, double tol) {
  for (std::size_t i = 1; i < traj.size(); ++i) {
    if (traj[i] < traj[i - 1] - tol) return false;
  }
  return true;
}

bool is_non_increasing(const Trajectory& traj, double tol) {
  for (std::size_t i = 1; i < traj.size(); ++i) {
    if (traj[i] > traj[i - 1] + tol) return false;
  }
  return true;
}

} // namespace hamchain
