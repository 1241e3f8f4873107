#pragma once
#include "types.hpp"
#include <vector>

namespace PrimeLab {

// Twin prime constant C2
constexpr double TWIN_PRIME_CONSTANT = 0.6601618158468696;

// gaps[i] = primes[i+1] - primes[i]
std::vector<i64> prime_gaps(const std::vector<i64> &primes);

struct RecordGap {
    i64 p;   // prime where the gap starts
    i64 gap;
};
std::vector<RecordGap> record_gaps(const std::vector<i64> &primes);

// Most frequent gap in gaps[begin, end); ties go to the smaller gap
i64 jumping_champion(const std::vector<i64> &gaps, size_t begin, size_t end);

struct LiPoint {
    double x;
    double li;
};
// Trapezoid integral of 1/log t from 2 over x = 2, 2+step, ... <= n_max
std::vector<LiPoint> li_trapezoid(i64 n_max, i64 step);

struct Histogram {
    std::vector<double> edges;  // bins + 1 edges over [min, max]
    std::vector<i64> counts;
};
// Equal-width bins; the last bin includes the right edge
Histogram histogram(const std::vector<double> &values, int bins);

// Values on a size x size Ulam spiral (size odd), 1 at the centre
std::vector<std::vector<i64>> ulam_spiral(int size);

} // namespace PrimeLab
