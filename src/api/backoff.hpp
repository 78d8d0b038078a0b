#pragma once

#include <atomic>
#include <chrono>
#include <functional>

/// Blocks for `duration`. Returns false if `cancel` was raised before or
/// during the wait.
using SleepFn = std::function<bool(std::chrono::milliseconds duration,
                                   const std::atomic<bool>* cancel)>;

/// Default SleepFn: sleeps in 100ms slices and checks the cancel flag
/// between slices.
bool interruptible_sleep(std::chrono::milliseconds duration,
                         const std::atomic<bool>* cancel);

/// min(base * 2^attempt, cap)
std::chrono::milliseconds exponential_backoff(int attempt, int base_ms, int cap_ms);

inline bool is_cancelled(const std::atomic<bool>* cancel) {
    return cancel && cancel->load();
}
