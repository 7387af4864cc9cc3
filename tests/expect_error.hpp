#pragma once
#include <optional>
#include <hamchain/error.hpp>

// Runs f and returns the kind of hamchain::Error it threw, or nullopt if it
// returned normally. Any other exception type escapes and fails the test.
template <class F>
std::optional<hamchain::ErrorKind> thrown_kind(F&& f) {
  try {
    f();
  } catch (const hamchain::Error& e) {
    return e.kind();
  }
  return std::nullopt;
}
