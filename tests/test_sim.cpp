#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>
#include <cstdint>

#include <hamchain/diagnostics.hpp>
#include <hamchain/sim.hpp>
#include <hamchain/stiffness.hpp>
#include "expect_error.hpp"

using Catch::Approx;
using namespace hamchain;

namespace {

struct Chain {
  EnergyModel model;
  State initial;
  explicit Chain(int n, std::uint32_t seed = 2024u)
    : model(build_stiffness(n)), initial(make_initial_state(n, seed)) {}
};

} // namespace

TEST_CASE("run records one energy per step and leaves the initial state alone") {
  Chain c(16);
  const State before = c.initial;
  const Trajectory t = run(c.initial, 0.01, 50, c.model, Scheme::Verlet);

  REQUIRE(t.size() == 50);
  for (double e : t) REQUIRE(e >= 0.0);
  REQUIRE((c.initial.q.array() == before.q.array()).all());
  REQUIRE((c.initial.p.array() == before.p.array()).all());

  SECTION("zero steps yields an empty trajectory") {
    REQUIRE(run(c.initial, 0.01, 0, c.model, Scheme::ForwardEuler).empty());
  }

  SECTION("sample k is the energy after step k") {
    State s = c.initial;
    verlet_step(c.model, s, 0.01);
    REQUIRE(t[0] == c.model.total_energy(s));
  }
}

TEST_CASE("Verlet energy stays in a bounded band") {
  Chain c(128);
  const double dt = 0.01;

  const double err_one_period = conservation_error(run(c.initial, dt, 628, c.model, Scheme::Verlet));
  REQUIRE(err_one_period < 0.05);

  // Ten times the horizon: no drift accumulates.
  const Trajectory long_run = run(c.initial, dt, 6280, c.model, Scheme::Verlet);
  REQUIRE(conservation_error(long_run) < 0.05);
  REQUIRE(std::fabs(relative_drift(long_run)) < 0.05);
}

TEST_CASE("forward Euler gains and backward Euler loses energy monotonically") {
  Chain c(128);
  const Comparison cmp = run_all(c.initial, 0.01, 628, c.model);

  const Trajectory& fe = cmp.of(Scheme::ForwardEuler);
  const Trajectory& be = cmp.of(Scheme::BackwardEuler);
  const double tol = 1e-12 * fe.front();

  REQUIRE(is_non_decreasing(fe, tol));
  REQUIRE(fe.back() > fe.front());
  REQUIRE(relative_drift(fe) > 0.0);

  REQUIRE(is_non_increasing(be, tol));
  REQUIRE(be.back() < be.front());
  REQUIRE(relative_drift(be) < 0.0);

  // The symplectic scheme conserves far better than either Euler variant.
  const double v_err = conservation_error(cmp.of(Scheme::Verlet));
  REQUIRE(v_err < conservation_error(fe));
  REQUIRE(v_err < conservation_error(be));
}

TEST_CASE("halving dt over a fixed horizon improves conservation") {
  Chain c(128);
  const Comparison coarse = run_all(c.initial, 0.01, 628, c.model);
  const Comparison fine   = run_all(c.initial, 0.005, 1256, c.model);

  REQUIRE(conservation_error(fine.of(Scheme::ForwardEuler))
          < conservation_error(coarse.of(Scheme::ForwardEuler)));
  REQUIRE(conservation_error(fine.of(Scheme::BackwardEuler))
          < conservation_error(coarse.of(Scheme::BackwardEuler)));
  REQUIRE(conservation_error(fine.of(Scheme::Verlet))
          <= conservation_error(coarse.of(Scheme::Verlet)));
}

TEST_CASE("Verlet is time reversible") {
  Chain c(128);
  const double dt = 0.01;
  const std::size_t steps = 628;

  State s = c.initial;
  VerletIntegrator verlet(c.model);
  for (std::size_t k = 0; k < steps; ++k) verlet.step(s, dt);
  REQUIRE((s.q - c.initial.q).norm() > 1e-3); // actually moved
  for (std::size_t k = 0; k < steps; ++k) verlet.step(s, -dt);

  REQUIRE((s.q - c.initial.q).norm() < 1e-8 * c.initial.q.norm());
  REQUIRE(s.p.norm() < 1e-8 * c.initial.q.norm());

  SECTION("forward Euler is not") {
    State e = c.initial;
    for (std::size_t k = 0; k < steps; ++k) forward_euler_step(c.model, e, dt);
    for (std::size_t k = 0; k < steps; ++k) forward_euler_step(c.model, e, -dt);
    REQUIRE((e.q - c.initial.q).norm() > 1e-6);
  }
}

TEST_CASE("runs are deterministic for a fixed seed") {
  Params p;
  p.n = 32;
  p.dt = 0.02;
  p.seed = 77u;

  const Comparison a = simulate(p);
  const Comparison b = simulate(p);
  for (Scheme s : kAllSchemes) REQUIRE(a.of(s) == b.of(s));

  SECTION("parallel execution gives identical trajectories") {
    const Comparison par = simulate(p, Execution::Parallel);
    for (Scheme s : kAllSchemes) REQUIRE(par.of(s) == a.of(s));
  }

  SECTION("a different seed changes the trajectories") {
    Params q = p;
    q.seed = 78u;
    REQUIRE(simulate(q).of(Scheme::Verlet) != a.of(Scheme::Verlet));
  }
}

TEST_CASE("simulate derives the step count from dt") {
  Params p;
  p.n = 8;
  p.dt = 0.1;
  p.seed = 1u;
  const Comparison c = simulate(p);
  REQUIRE(c.num_steps == 63); // round(2*pi / 0.1)
  REQUIRE(c.dt == 0.1);
  for (Scheme s : kAllSchemes) REQUIRE(c.of(s).size() == 63);
}

TEST_CASE("rest state is a fixed point for every scheme") {
  const EnergyModel model(build_stiffness(16));
  const Comparison c = run_all(make_rest_state(16), 0.01, 100, model);
  for (Scheme s : kAllSchemes) {
    REQUIRE(c.of(s).size() == 100);
    for (double e : c.of(s)) REQUIRE(e == 0.0);
  }
  REQUIRE(thrown_kind([&]{ (void)conservation_error(c.of(Scheme::Verlet)); })
          == ErrorKind::DegenerateMean);
}

TEST_CASE("invalid inputs fail before any step") {
  SECTION("non-positive system size") {
    Params p;
    p.n = 0;
    REQUIRE(thrown_kind([&]{ (void)simulate(p); }) == ErrorKind::InvalidDimension);
    p.n = -4;
    REQUIRE(thrown_kind([&]{ (void)simulate(p); }) == ErrorKind::InvalidDimension);
  }

  SECTION("state of the wrong size") {
    const EnergyModel model(build_stiffness(8));
    const State s = make_initial_state(6, 1u);
    REQUIRE(thrown_kind([&]{ (void)run(s, 0.01, 0, model, Scheme::Verlet); })
            == ErrorKind::DimensionMismatch);
  }

  SECTION("parallel runs re-throw worker errors") {
    const EnergyModel model(build_stiffness(8));
    const State s = make_initial_state(6, 1u);
    REQUIRE(thrown_kind([&]{ (void)run_all(s, 0.01, 10, model, Execution::Parallel); })
            == ErrorKind::DimensionMismatch);
  }

  SECTION("oversized runs are rejected up front") {
    Params p;
    p.n = 8;
    p.dt = 1e-300;
    REQUIRE(thrown_kind([&]{ (void)simulate(p); }) == ErrorKind::InvalidParameter);
    p.dt = 0.01;
    p.steps = 1'000'000'000'000'000'000ull;
    REQUIRE(thrown_kind([&]{ (void)simulate(p, Execution::Parallel); })
            == ErrorKind::InvalidParameter);

    const EnergyModel model(build_stiffness(8));
    const State s = make_initial_state(8, 1u);
    REQUIRE(thrown_kind([&]{ (void)run(s, 0.01, kMaxSteps + 1, model, Scheme::Verlet); })
            == ErrorKind::InvalidParameter);
  }

  SECTION("diverging run fails outright") {
    const EnergyModel model(build_stiffness(8));
    const State s = make_initial_state(8, 1u);
    REQUIRE(thrown_kind([&]{ (void)run(s, 1e200, 10, model, Scheme::ForwardEuler); })
            == ErrorKind::NonFiniteState);
  }
}
