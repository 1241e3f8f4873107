#include "prime_statistics.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <stdexcept>

namespace PrimeLab {

std::vector<i64> prime_gaps(const std::vector<i64> &primes) {
    std::vector<i64> gaps;
    if (primes.size() < 2) return gaps;
    gaps.reserve(primes.size() - 1);
    for (size_t i = 1; i < primes.size(); ++i) {
        gaps.push_back(primes[i] - primes[i - 1]);
    }
    return gaps;
}

std::vector<RecordGap> record_gaps(const std::vector<i64> &primes) {
    std::vector<RecordGap> out;
    i64 best = 0;
    for (size_t i = 1; i < primes.size(); ++i) {
        i64 g = primes[i] - primes[i - 1];
        if (g > best) {
            best = g;
            out.push_back({primes[i - 1], g});
        }
    }
    return out;
}

i64 jumping_champion(const std::vector<i64> &gaps, size_t begin, size_t end) {
    if (end > gaps.size()) end = gaps.size();
    if (begin >= end) {
        throw std::invalid_argument("jumping_champion(): empty window");
    }
    std::map<i64, i64> freq;
    for (size_t i = begin; i < end; ++i) ++freq[gaps[i]];
    i64 champ = 0, best = 0;
    for (const auto &[g, c] : freq) {
        if (c > best) {
            best = c;
            champ = g;
        }
    }
    return champ;
}

std::vector<LiPoint> li_trapezoid(i64 n_max, i64 step) {
    if (step <= 0) {
        throw std::invalid_argument("li_trapezoid(): step must be positive");
    }
    std::vector<LiPoint> out;
    double acc = 0.0;
    double prev_x = 0.0, prev_f = 0.0;
    for (i64 x = 2; x <= n_max; x += step) {
        double xd = (double)x;
        double f = 1.0 / std::log(xd);
        if (!out.empty()) acc += 0.5 * (prev_f + f) * (xd - prev_x);
        out.push_back({xd, acc});
        prev_x = xd;
        prev_f = f;
    }
    return out;
}

Histogram histogram(const std::vector<double> &values, int bins) {
    if (bins <= 0) {
        throw std::invalid_argument("histogram(): bins must be positive");
    }
    Histogram h;
    h.counts.assign(bins, 0);
    double lo = 0.0, hi = 1.0;
    if (!values.empty()) {
        auto [mn, mx] = std::minmax_element(values.begin(), values.end());
        lo = *mn;
        hi = *mx;
    }
    if (hi <= lo) {
        lo -= 0.5;
        hi += 0.5;
    }
    const double width = (hi - lo) / bins;
    for (int i = 0; i <= bins; ++i) h.edges.push_back(lo + width * i);
    for (double v : values) {
        int b = (int)((v - lo) / width);
        if (b >= bins) b = bins - 1;
        if (b < 0) b = 0;
        ++h.counts[b];
    }
    return h;
}

std::vector<std::vector<i64>> ulam_spiral(int size) {
    if (size <= 0 || size % 2 == 0) {
        throw std::invalid_argument("ulam_spiral(): size must be a positive odd integer");
    }
    const i64 n_max = (i64)size * size;
    std::vector<std::vector<i64>> grid(size, std::vector<i64>(size, 0));
    int x = size / 2, y = size / 2;
    grid[y][x] = 1;
    i64 value = 1;
    int step = 1;
    // right, up, left, down; the last two legs are one longer
    const int dx[4] = {1, 0, -1, 0};
    const int dy[4] = {0, -1, 0, 1};
    while (value < n_max) {
        for (int leg = 0; leg < 4; ++leg) {
            int reps = leg < 2 ? step : step + 1;
            for (int r = 0; r < reps && value < n_max; ++r) {
                x += dx[leg];
                y += dy[leg];
                grid[y][x] = ++value;
            }
        }
        step += 2;
    }
    return grid;
}

} // namespace PrimeLab
