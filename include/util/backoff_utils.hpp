#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>

namespace hookrelay::monad {

struct ExponentialBackoffOptions {
  std::chrono::milliseconds initial_delay{500};
  std::chrono::milliseconds max_delay{30000};
  double multiplier{2.0};
  // Fraction of the nominal delay applied as symmetric random jitter.
  double jitter_ratio{0.2};
};

// Reconnect delay generator. The nominal delay starts at `initial_delay`,
// grows by `multiplier` per consecutive failure and saturates at `max_delay`;
// each returned delay is the nominal one scaled by a factor drawn uniformly
// from [1 - jitter_ratio, 1 + jitter_ratio].
class JitteredExponentialBackoff {
public:
  JitteredExponentialBackoff() = default;
  explicit JitteredExponentialBackoff(ExponentialBackoffOptions options)
      : options_(options) {}

  void UpdateOptions(const ExponentialBackoffOptions &options) {
    options_ = options;
  }

  const ExponentialBackoffOptions &options() const { return options_; }

  void Reset() { attempts_ = 0; }

  int attempts() const { return attempts_; }

  // Nominal delay the next call to NextDelay() is centred on.
  std::chrono::milliseconds NominalDelay() const {
    const double initial =
        static_cast<double>(std::max<long long>(1, options_.initial_delay.count()));
    const double cap = static_cast<double>(
        std::max(options_.initial_delay, options_.max_delay).count());
    const double grown =
        initial * std::pow(std::max(1.0, options_.multiplier), attempts_);
    return std::chrono::milliseconds(
        static_cast<long long>(std::min(grown, cap)));
  }

  template <typename Rng> std::chrono::milliseconds NextDelay(Rng &rng) {
    const auto nominal = NominalDelay();
    ++attempts_;
    const double ratio = std::clamp(options_.jitter_ratio, 0.0, 1.0);
    if (ratio == 0.0) {
      return nominal;
    }
    std::uniform_real_distribution<double> dist(1.0 - ratio, 1.0 + ratio);
    const double jittered = static_cast<double>(nominal.count()) * dist(rng);
    return std::chrono::milliseconds(
        static_cast<long long>(std::max(0.0, std::round(jittered))));
  }

private:
  ExponentialBackoffOptions options_{};
  int attempts_{0};
};

} // namespace hookrelay::monad
