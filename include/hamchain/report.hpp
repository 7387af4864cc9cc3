#pragma once
#include <ostream>
#include <string>
#include <hamchain/sim.hpp>

namespace hamchain {

// One line per scheme: name, first/last energy, conservation error, drift.
// Schemes whose diagnostics are undefined (zero energy) print "--".
std::string summary_table(const Comparison& c);

// step,time,verlet,forward_euler,backward_euler
// time is (step + 1) * dt: the sample is taken after the step.
void write_trajectories_csv(std::ostream& out, const Comparison& c);

} // namespace hamchain
