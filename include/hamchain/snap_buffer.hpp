#pragma once
#include <atomic>
#include <cstdint>
#include <mutex>

namespace hamchain {

// Single-producer single-consumer latest-only buffer. The payload may own heap
// memory, so the slot is guarded; the sequence lets readers skip the lock
// when nothing new arrived.
template <class T>
class LatestBuffer {
public:
  void publish(const T& v) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      data_ = v;
    }
    seq_.fetch_add(1, std::memory_order_release);
  }

  // Try to consume if sequence advanced past cursor.
  bool try_consume_latest(std::uint64_t& cursor, T& out) const {
    const auto s = seq_.load(std::memory_order_acquire);
    if (s == cursor) return false;
    std::lock_guard<std::mutex> lock(mu_);
    out = data_;
    cursor = s;
    return true;
  }

private:
  mutable std::mutex mu_;
  T data_{};
  std::atomic<std::uint64_t> seq_{0};
};

using SnapshotBuffer = LatestBuffer<struct RunSnapshot>;

} // namespace hamchain
