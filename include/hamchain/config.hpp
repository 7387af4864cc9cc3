#pragma once
#include <cstddef>
#include <cstdint>
#include <istream>
#include <numbers>
#include <optional>
#include <string>
#include <vector>

namespace hamchain {

inline constexpr double kPI  = std::numbers::pi_v<double>;
inline constexpr double kTAU = 2.0 * kPI;

// Largest run accepted by validate. Each scheme stores one double per step.
inline constexpr std::size_t kMaxSteps = 10'000'000;

struct Params {
  int n = 128;                          // system size
  double dt = 0.01;                     // time step
  std::optional<std::size_t> steps;     // overrides the derived step count
  std::optional<std::uint32_t> seed;    // initial-noise seed
};

// steps if set, else round(2*pi / dt): one period of the unit frequency.
// Saturates to SIZE_MAX when 2*pi / dt does not fit.
std::size_t num_steps(const Params& p);

// Throws Error{InvalidDimension} for n <= 0 and Error{InvalidParameter} for a
// non-positive or non-finite dt or a step count of zero or above kMaxSteps.
void validate(const Params& p);

// Stream-based loader for "key = value" lines (n, dt, steps, seed).
// Blank lines and '#' comments are ignored, whitespace is trimmed, malformed
// or unknown rows are skipped. Keys not present keep their value from base.
Params params_from_stream(std::istream& in, Params base = {});

// Filesystem wrapper; returns nullopt if the file cannot be opened.
std::optional<Params> load_params(const std::string& path, Params base = {});

// Command-line overrides: --n=, --dt=, --steps=, --seed=, --config=<file>.
// Applied left to right. Arguments it does not recognize go to rest when given,
// otherwise they raise Error{InvalidParameter}. Malformed values always do.
Params params_from_args(const std::vector<std::string>& args,
                        Params base = {},
                        std::vector<std::string>* rest = nullptr);

} // namespace hamchain
