#include <catch2/catch_test_macros.hpp>
#include <sstream>
#include <string>
#include <vector>

#include <hamchain/report.hpp>
#include <hamchain/stiffness.hpp>

using namespace hamchain;

static std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> out;
  std::istringstream ss(text);
  std::string line;
  while (std::getline(ss, line)) out.push_back(line);
  return out;
}

TEST_CASE("summary_table lists every scheme") {
  Params p;
  p.n = 16;
  p.dt = 0.05;
  p.seed = 3u;
  const Comparison c = simulate(p);

  const auto lines = lines_of(summary_table(c));
  REQUIRE(lines.size() == 4); // header + 3 schemes
  REQUIRE(lines[0].find("cons_err") != std::string::npos);
  REQUIRE(lines[1].rfind("Verlet", 0) == 0);
  REQUIRE(lines[2].rfind("Forward Euler", 0) == 0);
  REQUIRE(lines[3].rfind("Backward Euler", 0) == 0);
  REQUIRE(lines[1].find("--") == std::string::npos);
}

TEST_CASE("summary_table marks undefined diagnostics") {
  const EnergyModel model(build_stiffness(4));
  const Comparison c = run_all(make_rest_state(4), 0.01, 5, model);
  const auto lines = lines_of(summary_table(c));
  REQUIRE(lines.size() == 4);
  for (std::size_t i = 1; i < lines.size(); ++i) {
    REQUIRE(lines[i].find("--") != std::string::npos);
  }

  SECTION("empty trajectories too") {
    const auto empty = lines_of(summary_table(Comparison{}));
    REQUIRE(empty.size() == 4);
    REQUIRE(empty[2].find("--") != std::string::npos);
  }
}

TEST_CASE("write_trajectories_csv writes one row per step") {
  const EnergyModel model(build_stiffness(8));
  const Comparison c = run_all(make_initial_state(8, 4u), 0.1, 10, model);

  std::ostringstream out;
  write_trajectories_csv(out, c);
  const auto lines = lines_of(out.str());

  REQUIRE(lines.size() == 11);
  REQUIRE(lines[0] == "step,time,verlet,forward_euler,backward_euler");
  REQUIRE(lines[1].rfind("0,0.1", 0) == 0);
  REQUIRE(lines[10].rfind("9,", 0) == 0);

  // Values round-trip at full precision.
  std::istringstream row(lines[1]);
  std::string cell;
  std::vector<std::string> cells;
  while (std::getline(row, cell, ',')) cells.push_back(cell);
  REQUIRE(cells.size() == 5);
  REQUIRE(std::stod(cells[2]) == c.of(Scheme::Verlet)[0]);
  REQUIRE(std::stod(cells[3]) == c.of(Scheme::ForwardEuler)[0]);
  REQUIRE(std::stod(cells[4]) == c.of(Scheme::BackwardEuler)[0]);
}
