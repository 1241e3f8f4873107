#pragma once
#include <algorithm>
#include <chrono>
#include <vector>

static inline std::chrono::high_resolution_clock::time_point now_tp() {
    return std::chrono::high_resolution_clock::now();
}

static inline double ms_since(std::chrono::high_resolution_clock::time_point t0) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - t0
    ).count();
}

// Median wall time of `trials` calls to fn
template <typename Fn>
static inline double median_time_ms(int trials, Fn &&fn) {
    std::vector<double> times;
    times.reserve(trials > 0 ? trials : 1);
    for (int t = 0; t < std::max(trials, 1); ++t) {
        auto t0 = now_tp();
        fn();
        times.push_back(ms_since(t0));
    }
    std::sort(times.begin(), times.end());
    size_t n = times.size();
    return (n % 2) ? times[n / 2] : 0.5 * (times[n / 2 - 1] + times[n / 2]);
}
