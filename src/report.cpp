#include <hamchain/report.hpp>
#include <cstdio>
#include <limits>
#include <hamchain/error.hpp>

namespace hamchain {

std::string summary_table(const Comparison& c) {
  std::string out;
  char line[160];
  std::snprintf(line, sizeof(line), "%-16s %14s %14s %14s %12s\n",
                "scheme", "E_first", "E_last", "cons_err", "drift");
  out += line;

  for (Scheme s : kAllSchemes) {
    const Trajectory& traj = c.of(s);
    if (traj.empty()) {
      std::snprintf(line, sizeof(line), "%-16s %14s %14s %14s %12s\n",
                    scheme_name(s), "--", "--", "--", "--");
      out += line;
      continue;
    }
    try {
      const EnergySummary sum = summarize(traj);
      std::snprintf(line, sizeof(line), "%-16s %14.6e %14.6e %14.6e %+12.4e\n",
                    scheme_name(s), sum.first, sum.last, sum.conservation_error, sum.drift);
    } catch (const Error& e) {
      if (e.kind() != ErrorKind::DegenerateMean) throw;
      std::snprintf(line, sizeof(line), "%-16s %14.6e %14.6e %14s %12s\n",
                    scheme_name(s), traj.front(), traj.back(), "--", "--");
    }
    out += line;
  }
  return out;
}

void write_trajectories_csv(std::ostream& out, const Comparison& c) {
  out << "step,time,verlet,forward_euler,backward_euler\n";
  const auto old_prec = out.precision(std::numeric_limits<double>::max_digits10);
  for (std::size_t k = 0; k < c.num_steps; ++k) {
    out << k << ',' << (static_cast<double>(k + 1) * c.dt);
    for (Scheme s : kAllSchemes) {
      const Trajectory& traj = c.of(s);
      out << ',';
      if (k < traj.size()) out << traj[k];
    }
    out << '\n';
  }
  out.precision(old_prec);
}

} // namespace hamchain
