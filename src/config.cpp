#include <hamchain/config.hpp>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <hamchain/error.hpp>

namespace hamchain {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::optional<double> to_double(const std::string& s) {
  try {
    std::size_t idx = 0;
    const double v = std::stod(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::optional<long long> to_integer(const std::string& s) {
  try {
    std::size_t idx = 0;
    const long long v = std::stoll(s, &idx);
    if (idx != s.size()) return std::nullopt;
    return v;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

// Applies one key/value pair. Returns false if the key is unknown or the value
// does not parse; p is left untouched in that case.
static bool apply_setting(Params& p, const std::string& key, const std::string& value) {
  if (key == "n") {
    const auto v = to_integer(value);
    if (!v || *v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max()) {
      return false;
    }
    p.n = static_cast<int>(*v);
    return true;
  }
  if (key == "dt") {
    const auto v = to_double(value);
    if (!v) return false;
    p.dt = *v;
    return true;
  }
  if (key == "steps") {
    const auto v = to_integer(value);
    if (!v || *v < 0) return false;
    p.steps = static_cast<std::size_t>(*v);
    return true;
  }
  if (key == "seed") {
    const auto v = to_integer(value);
    if (!v || *v < 0 || *v > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
      return false;
    }
    p.seed = static_cast<std::uint32_t>(*v);
    return true;
  }
  return false;
}

std::size_t num_steps(const Params& p) {
  if (p.steps.has_value()) return *p.steps;
  if (!(p.dt > 0.0) || !std::isfinite(p.dt)) return 0;
  const double periods = kTAU / p.dt;
  if (!(periods < 9.0e18)) return std::numeric_limits<std::size_t>::max();
  return static_cast<std::size_t>(std::llround(periods));
}

void validate(const Params& p) {
  if (p.n <= 0) {
    throw Error(ErrorKind::InvalidDimension,
                "n must be positive, got " + std::to_string(p.n));
  }
  if (!std::isfinite(p.dt) || p.dt <= 0.0) {
    throw Error(ErrorKind::InvalidParameter,
                "dt must be positive and finite, got " + std::to_string(p.dt));
  }
  const std::size_t steps = num_steps(p);
  if (steps == 0) {
    throw Error(ErrorKind::InvalidParameter, "run would take zero steps");
  }
  if (steps > kMaxSteps) {
    throw Error(ErrorKind::InvalidParameter,
                "run would take " + std::to_string(steps) + " steps, limit is " +
                std::to_string(kMaxSteps));
  }
}

Params params_from_stream(std::istream& in, Params base) {
  Params p = base;
  std::string line;
  while (std::getline(in, line)) {
    // Strip trailing comments, then whitespace.
    if (const auto hash = line.find('#'); hash != std::string::npos) line.erase(hash);
    const std::string raw = trim(line);
    if (raw.empty()) continue;

    const auto eq = raw.find('=');
    if (eq == std::string::npos) continue;
    const std::string key   = trim(raw.substr(0, eq));
    const std::string value = trim(raw.substr(eq + 1));
    if (key.empty() || value.empty()) continue;

    (void)apply_setting(p, key, value); // bad rows are skipped
  }
  return p;
}

std::optional<Params> load_params(const std::string& path, Params base) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return params_from_stream(f, base);
}

Params params_from_args(const std::vector<std::string>& args,
                        Params base,
                        std::vector<std::string>* rest) {
  Params p = base;
  for (const auto& arg : args) {
    const auto eq = arg.find('=');
    const bool is_flag = arg.rfind("--", 0) == 0 && eq != std::string::npos;
    const std::string key   = is_flag ? arg.substr(2, eq - 2) : std::string{};
    const std::string value = is_flag ? arg.substr(eq + 1) : std::string{};

    if (key == "config") {
      auto loaded = load_params(value, p);
      if (!loaded) {
        throw Error(ErrorKind::InvalidParameter, "cannot open config file '" + value + "'");
      }
      p = *loaded;
      continue;
    }
    if (key == "n" || key == "dt" || key == "steps" || key == "seed") {
      if (!apply_setting(p, key, value)) {
        throw Error(ErrorKind::InvalidParameter, "bad value in '" + arg + "'");
      }
      continue;
    }

    if (rest) rest->push_back(arg);
    else throw Error(ErrorKind::InvalidParameter, "unrecognized argument '" + arg + "'");
  }
  return p;
}

} // namespace hamchain
