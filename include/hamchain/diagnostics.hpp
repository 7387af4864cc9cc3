#pragma once
#include <vector>

namespace hamchain {

// Total energy per step, indexed by step number.
using Trajectory = std::vector<double>;

// Means with |mean| below this are treated as zero.
inline constexpr double kDegenerateMeanEps = 1e-12;

// (max - min) / mean. Smaller is better conservation.
// Throws Error{EmptyTrajectory} or Error{DegenerateMean}.
double conservation_error(const Trajectory& traj);

// (last - first) / first. Sign tells the drift direction.
double relative_drift(const Trajectory& traj);

struct EnergySummary {
  double first = 0.0;
  double last = 0.0;
  double min = 0.0;
  double max = 0.0;
  double mean = 0.0;
  double conservation_error = 0.0;
  double drift = 0.0;
};

EnergySummary summarize(const Trajectory& traj);

// Trend checks with an absolute tolerance per consecutive pair.
bool is_non_decreasing(const Trajectory& traj, double tol = 0.0);
bool is_non_increasing(const Trajectory& traj, double tol = 0.0);

} // namespace hamchain
