#pragma once
#include <array>
#include <cstddef>
#include <memory>
#include <Eigen/SparseCholesky>
#include <hamchain/energy.hpp>
#include <hamchain/state.hpp>

namespace hamchain {

enum class Scheme : int {
  Verlet = 0,
  ForwardEuler = 1,
  BackwardEuler = 2,
  Count
};

inline constexpr std::array<Scheme, 3> kAllSchemes{
  Scheme::Verlet, Scheme::ForwardEuler, Scheme::BackwardEuler
};

const char* scheme_name(Scheme s);

// One-shot step rules. Each reads a snapshot of (q, p) before writing either,
// checks the result and throws Error{NonFiniteState} if the step diverged.
void verlet_step(const EnergyModel& model, State& s, double dt);
void forward_euler_step(const EnergyModel& model, State& s, double dt);
// Factors (I + dt^2 L) on every call; use BackwardEulerIntegrator in loops.
void backward_euler_step(const EnergyModel& model, State& s, double dt);

// Stateful stepper bound to one model. Not shared between runs.
class Integrator {
public:
  virtual ~Integrator() = default;
  virtual Scheme scheme() const = 0;
  virtual void step(State& s, double dt) = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
};

class VerletIntegrator final : public Integrator {
public:
  explicit VerletIntegrator(const EnergyModel& model) : model_(model) {}
  Scheme scheme() const override { return Scheme::Verlet; }
  void step(State& s, double dt) override { verlet_step(model_, s, dt); }
private:
  const EnergyModel& model_;
};

class ForwardEulerIntegrator final : public Integrator {
public:
  explicit ForwardEulerIntegrator(const EnergyModel& model) : model_(model) {}
  Scheme scheme() const override { return Scheme::ForwardEuler; }
  void step(State& s, double dt) override { forward_euler_step(model_, s, dt); }
private:
  const EnergyModel& model_;
};

// Keeps the LDLT factorization of (I + dt^2 L) between steps. Refactors only
// when dt changes.
class BackwardEulerIntegrator final : public Integrator {
public:
  explicit BackwardEulerIntegrator(const EnergyModel& model) : model_(model) {}
  BackwardEulerIntegrator(const BackwardEulerIntegrator&) = delete;
  BackwardEulerIntegrator& operator=(const BackwardEulerIntegrator&) = delete;

  Scheme scheme() const override { return Scheme::BackwardEuler; }
  void step(State& s, double dt) override;

  std::size_t factorization_count() const { return factorizations_; }

private:
  void factor_(double dt);

  const EnergyModel& model_;
  Eigen::SimplicialLDLT<Operator> solver_;
  double factored_dt_{0.0};
  bool factored_{false};
  std::size_t factorizations_{0};
};

// The model must outlive the returned integrator.
std::unique_ptr<Integrator> make_integrator(Scheme s, const EnergyModel& model);

} // namespace hamchain
