#pragma once
#include <stdexcept>
#include <string>

namespace hamchain {

enum class ErrorKind : int {
  InvalidDimension = 0,  // n <= 0
  DimensionMismatch,     // vector length != n
  NonFiniteState,        // NaN/Inf in q or p after a step
  SingularSystem,        // implicit solve could not proceed
  EmptyTrajectory,
  DegenerateMean,        // mean energy ~ 0
  InvalidParameter       // dt, step count or spring constants out of range
};

inline const char* error_kind_name(ErrorKind k) {
  switch (k) {
    case ErrorKind::InvalidDimension:  return "InvalidDimension";
    case ErrorKind::DimensionMismatch: return "DimensionMismatch";
    case ErrorKind::NonFiniteState:    return "NonFiniteState";
    case ErrorKind::SingularSystem:    return "SingularSystem";
    case ErrorKind::EmptyTrajectory:   return "EmptyTrajectory";
    case ErrorKind::DegenerateMean:    return "DegenerateMean";
    case ErrorKind::InvalidParameter:  return "InvalidParameter";
    default: return "Unknown";
  }
}

// Every failure in the core surfaces as one of these, thrown where detected.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& what)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + what),
      kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace hamchain
