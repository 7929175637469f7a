#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

struct BackoffPolicy {
    std::chrono::milliseconds base{1000};
    std::chrono::milliseconds cap{30000};
    double jitter = 0.2;        // +/- fraction of the nominal delay
    uint32_t max_attempts = 10; // 0 = unlimited
};

// Exponential reconnect delays: base * 2^n, capped, with symmetric jitter.
class Backoff {
public:
    explicit Backoff(BackoffPolicy policy, uint64_t seed = std::random_device{}());

    // Delay before the next attempt, or nullopt once attempts are exhausted.
    std::optional<std::chrono::milliseconds> next_delay();

    void reset() { attempts_ = 0; }
    uint32_t attempts() const { return attempts_; }
    const BackoffPolicy& policy() const { return policy_; }

private:
    BackoffPolicy policy_;
    uint32_t attempts_ = 0;
    std::mt19937_64 rng_;
};
