#pragma once

/// @file retry.hpp
/// @brief Reconnect backoff schedule.
///
/// The supervisor asks the schedule how long to wait before reconnect
/// attempt N and sleeps on its own cancellable timer, so `stop()` never has
/// to wait out a backoff delay. The schedule itself never sleeps.

#include <algorithm>
#include <chrono>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <random>
#include <utility>

namespace protocol::retry {

using namespace std::chrono_literals;


// ═══════════════════════════════════════════════════════════════════════════
// Defaults
// ═══════════════════════════════════════════════════════════════════════════

using Duration = std::chrono::milliseconds;

inline constexpr Duration kFirstReconnectDelay = 2s;
inline constexpr Duration kReconnectDelayCeiling = 60s;
inline constexpr std::size_t kUnlimitedAttempts = 0;
inline constexpr double kGrowthFactor = 2.0;
inline constexpr double kJitterSpread = 0.1;


// ═══════════════════════════════════════════════════════════════════════════
// BackoffConfig
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Plain aggregate of durations and scalars
// • Copies are cheap and independent
//
// ═══════════════════════════════════════════════════════════════════════════

/// Reconnect backoff parameters as they appear in ClientConfig.
/// Out-of-range values are accepted here and corrected by ReconnectBackoff.
struct BackoffConfig {
    BackoffConfig() = default;
    ~BackoffConfig() = default;
    BackoffConfig(const BackoffConfig&) = default;
    BackoffConfig& operator=(const BackoffConfig&) = default;
    BackoffConfig(BackoffConfig&&) noexcept = default;
    BackoffConfig& operator=(BackoffConfig&&) noexcept = default;

    /// Consecutive failed connects tolerated; kUnlimitedAttempts never gives up.
    std::size_t max_attempts{kUnlimitedAttempts};
    Duration initial_delay{kFirstReconnectDelay};
    Duration max_delay{kReconnectDelayCeiling};
    double multiplier{kGrowthFactor};
    /// Relative spread in [0, 1]; each delay lands in base * (1 ± jitter).
    double jitter_factor{kJitterSpread};

    [[nodiscard]] auto with_max_attempts(std::size_t attempts) && -> BackoffConfig {
        max_attempts = attempts;
        return std::move(*this);
    }

    [[nodiscard]] auto with_initial_delay(Duration delay) && -> BackoffConfig {
        initial_delay = delay;
        return std::move(*this);
    }

    [[nodiscard]] auto with_max_delay(Duration delay) && -> BackoffConfig {
        max_delay = delay;
        return std::move(*this);
    }

    [[nodiscard]] auto with_multiplier(double factor) && -> BackoffConfig {
        multiplier = factor;
        return std::move(*this);
    }

    [[nodiscard]] auto with_jitter(double spread) && -> BackoffConfig {
        jitter_factor = spread;
        return std::move(*this);
    }
};


// ═══════════════════════════════════════════════════════════════════════════
// BackoffSchedule concept
// ═══════════════════════════════════════════════════════════════════════════

/// What the reconnect loop needs from a delay source.
template<typename S>
concept BackoffSchedule = requires(const S schedule, std::size_t n) {
    { schedule.delay_for(n) } -> std::convertible_to<Duration>;
    { schedule.exhausted(n) } -> std::same_as<bool>;
    { schedule.max_attempts() } -> std::convertible_to<std::size_t>;
};


// ═══════════════════════════════════════════════════════════════════════════
// ReconnectBackoff
// ═══════════════════════════════════════════════════════════════════════════
//
// RULE OF SIX RATIONALE:
// • Owns a PRNG by value; copying forks the random sequence
// • rng_ is mutable so delay_for stays const
//
// ═══════════════════════════════════════════════════════════════════════════

/// Capped exponential schedule with symmetric jitter.
///
///   base(n)  = min(initial * multiplier^n, max_delay)
///   delay(n) = min(base(n) * U(1 - jitter, 1 + jitter), max_delay)
class ReconnectBackoff {
public:
    ReconnectBackoff() = default;
    ~ReconnectBackoff() = default;
    ReconnectBackoff(const ReconnectBackoff&) = default;
    ReconnectBackoff& operator=(const ReconnectBackoff&) = default;
    ReconnectBackoff(ReconnectBackoff&&) noexcept = default;
    ReconnectBackoff& operator=(ReconnectBackoff&&) noexcept = default;

    explicit ReconnectBackoff(const BackoffConfig& config)
        : first_{std::max(config.initial_delay, Duration::zero())}
        , ceiling_{std::max(config.max_delay, first_)}
        , growth_{std::max(config.multiplier, 1.0)}
        , spread_{std::clamp(config.jitter_factor, 0.0, 1.0)}
        , budget_{config.max_attempts}
    {}

    /// Un-jittered delay before attempt `n` (0-indexed).
    [[nodiscard]] auto base_for(std::size_t n) const noexcept -> Duration {
        const auto ceiling = static_cast<double>(ceiling_.count());
        const auto grown = static_cast<double>(first_.count())
                         * std::pow(growth_, static_cast<double>(n));
        // pow overflows to inf for huge n; min() folds that into the ceiling.
        return Duration{static_cast<std::int64_t>(std::min(grown, ceiling))};
    }

    /// Delay before attempt `n` (0-indexed), jitter applied.
    [[nodiscard]] auto delay_for(std::size_t n) const -> Duration {
        const auto base = base_for(n);
        if (spread_ == 0.0 || base == Duration::zero()) {
            return base;
        }
        std::uniform_real_distribution<double> scale{1.0 - spread_, 1.0 + spread_};
        const auto jittered = static_cast<std::int64_t>(
            static_cast<double>(base.count()) * scale(rng_));
        return std::min(Duration{jittered}, ceiling_);
    }

    [[nodiscard]] auto max_attempts() const noexcept -> std::size_t { return budget_; }

    /// True once `failures` consecutive failed connects use up the budget.
    [[nodiscard]] auto exhausted(std::size_t failures) const noexcept -> bool {
        return budget_ != kUnlimitedAttempts && failures >= budget_;
    }

private:
    Duration first_{kFirstReconnectDelay};
    Duration ceiling_{kReconnectDelayCeiling};
    double growth_{kGrowthFactor};
    double spread_{kJitterSpread};
    std::size_t budget_{kUnlimitedAttempts};
    mutable std::mt19937 rng_{std::random_device{}()};
};

static_assert(BackoffSchedule<ReconnectBackoff>);

}  // namespace protocol::retry
