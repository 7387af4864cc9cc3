#include <hamchain/sim_runner.hpp>
#include <array>
#include <chrono>
#include <memory>
#include <hamchain/energy.hpp>
#include <hamchain/error.hpp>
#include <hamchain/integrators.hpp>
#include <hamchain/state.hpp>
#include <hamchain/stiffness.hpp>

namespace hamchain {

namespace {

constexpr std::size_t kSchemeCount = static_cast<std::size_t>(Scheme::Count);

// Everything one comparison run needs. The model lives on the heap so the
// integrators' references survive moves of the World.
struct World {
  std::unique_ptr<EnergyModel> model;
  std::array<State, kSchemeCount> states{};
  std::array<std::unique_ptr<Integrator>, kSchemeCount> integrators{};
  RunSnapshot snap{};
};

World build_world(const Params& p, std::uint64_t generation) {
  World w;
  w.snap.generation = generation;
  w.snap.n = p.n;
  w.snap.dt = p.dt;
  w.snap.num_steps = num_steps(p);

  w.model = std::make_unique<EnergyModel>(build_stiffness(p.n));
  const State initial = make_initial_state(p.n, p.seed);
  for (std::size_t i = 0; i < kSchemeCount; ++i) {
    w.states[i] = initial;
    w.integrators[i] = make_integrator(kAllSchemes[i], *w.model);
    w.snap.trajectories[i].reserve(w.snap.num_steps);
  }
  return w;
}

// Advances every scheme by up to `count` steps. Stops early at num_steps.
// Energies are recorded only once all schemes have stepped, so a failed step
// leaves every trajectory at snap.step entries.
void advance(World& w, int count, double dt) {
  for (int c = 0; c < count && w.snap.step < w.snap.num_steps; ++c) {
    for (std::size_t i = 0; i < kSchemeCount; ++i) {
      w.integrators[i]->step(w.states[i], dt);
    }
    for (std::size_t i = 0; i < kSchemeCount; ++i) {
      w.snap.trajectories[i].push_back(w.model->total_energy(w.states[i]));
    }
    ++w.snap.step;
  }
  if (w.snap.step >= w.snap.num_steps) w.snap.finished = true;
}

} // namespace

void SimRunner::configure(const Params& p) {
  if (running_.load()) {
    request_restart(p); // the thread owns params_ now
    return;
  }
  validate(p);
  params_ = p;
}

void SimRunner::request_restart(const Params& p) {
  validate(p);
  {
    std::lock_guard<std::mutex> lock(pending_mu_);
    pending_params_ = p;
  }
  pending_restart_.store(true, std::memory_order_release);
}

void SimRunner::start() {
  if (running_.load()) return;
  running_.store(true);
  th_ = std::thread(&SimRunner::thread_main_, this);
}

void SimRunner::stop() {
  if (!running_.load()) return;
  running_.store(false);
  if (th_.joinable()) th_.join();
}

void SimRunner::thread_main_() {
  std::uint64_t generation = 0;
  std::uint64_t tick = 0;

  // Failures inside the thread cannot reach the caller; they end the run and
  // travel in the snapshot instead.
  auto rebuild = [&](const Params& p) {
    World w;
    try {
      w = build_world(p, generation);
    } catch (const Error& e) {
      w = World{};
      w.snap.generation = generation;
      w.snap.n = p.n;
      w.snap.dt = p.dt;
      w.snap.finished = true;
      w.snap.error = e.what();
    }
    return w;
  };

  World world = rebuild(params_);

  using clock = std::chrono::steady_clock;
  const auto tick_ns = std::chrono::nanoseconds(1'000'000'000LL / 120); // 120 Hz publish cadence
  auto next = clock::now();

  while (running_.load(std::memory_order_relaxed)) {
    if (pending_restart_.load(std::memory_order_acquire)) {
      pending_restart_.store(false, std::memory_order_relaxed);
      std::optional<Params> p;
      {
        std::lock_guard<std::mutex> lock(pending_mu_);
        p.swap(pending_params_);
      }
      if (p) {
        params_ = *p;
        ++generation;
        world = rebuild(params_);
      }
    }

    const int per_tick = steps_per_tick.load(std::memory_order_relaxed);
    if (!world.snap.finished && per_tick > 0) {
      try {
        advance(world, per_tick, params_.dt);
      } catch (const Error& e) {
        world.snap.finished = true;
        world.snap.error = e.what();
      }
    }

    world.snap.tick = ++tick; // heartbeats continue while paused or finished
    buffer_.publish(world.snap);

    next += tick_ns;
    std::this_thread::sleep_until(next);
  }
}

} // namespace hamchain
