#include "api/backoff.hpp"

#include <algorithm>
#include <thread>

bool interruptible_sleep(std::chrono::milliseconds duration,
                         const std::atomic<bool>* cancel) {
    using namespace std::chrono;
    const auto slice = milliseconds(100);
    auto deadline = steady_clock::now() + duration;

    while (!is_cancelled(cancel)) {
        auto now = steady_clock::now();
        if (now >= deadline) return true;
        auto left = duration_cast<milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, slice));
    }
    return false;
}

std::chrono::milliseconds exponential_backoff(int attempt, int base_ms, int cap_ms) {
    long long delay = base_ms;
    for (int i = 0; i < attempt && delay < cap_ms; ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<long long>(delay, cap_ms));
}
