#include "backoff.hpp"

#include <algorithm>
#include <cmath>

Backoff::Backoff(BackoffPolicy policy, uint64_t seed)
    : policy_(policy), rng_(seed) {}

std::optional<std::chrono::milliseconds> Backoff::next_delay() {
    if (policy_.max_attempts != 0 && attempts_ >= policy_.max_attempts) {
        return std::nullopt;
    }

    // 2^n overflows long before it matters; the cap wins from n = 31 on.
    uint32_t exp = std::min<uint32_t>(attempts_, 31);
    double nominal = static_cast<double>(policy_.base.count()) * std::ldexp(1.0, exp);
    nominal = std::min(nominal, static_cast<double>(policy_.cap.count()));
    ++attempts_;

    double jitter = std::clamp(policy_.jitter, 0.0, 1.0);
    if (jitter > 0.0) {
        std::uniform_real_distribution<double> dist(-jitter, jitter);
        nominal *= 1.0 + dist(rng_);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(nominal)));
}
