#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>
#include <hamchain/config.hpp>
#include <hamchain/snap.hpp>
#include <hamchain/snap_buffer.hpp>

namespace hamchain {

// Owns the integration thread and publishes snapshots. All three schemes
// advance in lock step from one initial condition; each keeps its own state.
class SimRunner {
public:
  SimRunner() = default;
  ~SimRunner() { stop(); }
  SimRunner(const SimRunner&) = delete;
  SimRunner& operator=(const SimRunner&) = delete;

  // Validates and stores params for the next start. Once running, this is a
  // request_restart.
  void configure(const Params& p);

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // Hot restart with new params; validated on the calling thread.
  void request_restart(const Params& p); // safe to call from UI thread

  SnapshotBuffer& buffer() { return buffer_; }
  const SnapshotBuffer& buffer() const { return buffer_; }

  // Control surface
  std::atomic<int> steps_per_tick{2}; // 0 = paused

private:
  void thread_main_();

  std::thread th_;
  std::atomic<bool> running_{false};

  SnapshotBuffer buffer_;
  Params params_{};

  std::mutex pending_mu_;
  std::optional<Params> pending_params_;
  std::atomic<bool> pending_restart_{false};
};

} // namespace hamchain
