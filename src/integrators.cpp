#include <hamchain/integrators.hpp>
#include <string>
#include <utility>
#include <hamchain/error.hpp>

namespace hamchain {

const char* scheme_name(Scheme s) {
  switch (s) {
    case Scheme::Verlet:        return "Verlet";
    case Scheme::ForwardEuler:  return "Forward Euler";
    case Scheme::BackwardEuler: return "Backward Euler";
    default: return "Unknown";
  }
}

static void check_finite_after_step(const State& s, Scheme scheme) {
  if (!is_finite(s)) {
    throw Error(ErrorKind::NonFiniteState,
                std::string(scheme_name(scheme)) + " step produced a non-finite state");
  }
}

void verlet_step(const EnergyModel& model, State& s, double dt) {
  model.check_state(s);
  const Eigen::VectorXd q0 = s.q;
  const Eigen::VectorXd p0 = s.p;

  // drift - kick - drift
  const Eigen::VectorXd q_half = q0 + (0.5 * dt) * model.velocity(p0);
  const Eigen::VectorXd p_new  = p0 - dt * model.potential_gradient(q_half);
  s.q = q_half + (0.5 * dt) * model.velocity(p_new);
  s.p = p_new;

  check_finite_after_step(s, Scheme::Verlet);
}

void forward_euler_step(const EnergyModel& model, State& s, double dt) {
  model.check_state(s);
  const Eigen::VectorXd q0 = s.q;
  const Eigen::VectorXd p0 = s.p;

  // Both updates read the old state.
  s.q = q0 + dt * model.velocity(p0);
  s.p = p0 - dt * model.potential_gradient(q0);

  check_finite_after_step(s, Scheme::ForwardEuler);
}

// p' = A^-1 (p - dt L q), q' = q + dt p'
static void backward_euler_update(const EnergyModel& model,
                                  const Eigen::SimplicialLDLT<Operator>& solver,
                                  State& s, double dt) {
  const Eigen::VectorXd q0 = s.q;
  const Eigen::VectorXd p0 = s.p;

  const Eigen::VectorXd rhs = p0 - dt * model.potential_gradient(q0);
  Eigen::VectorXd p_new = solver.solve(rhs);
  if (solver.info() != Eigen::Success) {
    throw Error(ErrorKind::SingularSystem, "backward Euler solve failed");
  }
  s.q = q0 + dt * p_new;
  s.p = std::move(p_new);

  check_finite_after_step(s, Scheme::BackwardEuler);
}

// A = I + dt^2 L
static Operator implicit_matrix(const EnergyModel& model, double dt) {
  const Eigen::Index n = model.dimension();
  Operator I(n, n);
  I.setIdentity();
  Operator A = I + (dt * dt) * model.stiffness();
  A.makeCompressed();
  return A;
}

void backward_euler_step(const EnergyModel& model, State& s, double dt) {
  model.check_state(s);
  Eigen::SimplicialLDLT<Operator> solver;
  solver.compute(implicit_matrix(model, dt));
  if (solver.info() != Eigen::Success) {
    throw Error(ErrorKind::SingularSystem,
                "factorization of I + dt^2 L failed for dt=" + std::to_string(dt));
  }
  backward_euler_update(model, solver, s, dt);
}

void BackwardEulerIntegrator::factor_(double dt) {
  solver_.compute(implicit_matrix(model_, dt));
  factored_ = false;
  if (solver_.info() != Eigen::Success) {
    throw Error(ErrorKind::SingularSystem,
                "factorization of I + dt^2 L failed for dt=" + std::to_string(dt));
  }
  factored_dt_ = dt;
  factored_ = true;
  ++factorizations_;
}

void BackwardEulerIntegrator::step(State& s, double dt) {
  model_.check_state(s);
  if (!factored_ || dt != factored_dt_) factor_(dt);
  backward_euler_update(model_, solver_, s, dt);
}

std::unique_ptr<Integrator> make_integrator(Scheme s, const EnergyModel& model) {
  switch (s) {
    case Scheme::Verlet:        return std::make_unique<VerletIntegrator>(model);
    case Scheme::ForwardEuler:  return std::make_unique<ForwardEulerIntegrator>(model);
    case Scheme::BackwardEuler: return std::make_unique<BackwardEulerIntegrator>(model);
    default:
      throw Error(ErrorKind::InvalidParameter,
                  "unknown scheme " + std::to_string(static_cast<int>(s)));
  }
}

} // namespace hamchain
