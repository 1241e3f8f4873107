#pragma once
#include "types.hpp"
#include "factorization.hpp"
#include <vector>

namespace PrimeLab {

// sigma[k] = sum of divisors of k, k = 0..n (sigma[0] = 0)
std::vector<i64> sigma_sieve(i64 n);

// sigma(n) = prod (p^(a+1) - 1) / (p - 1)
u64 sigma_from_factorization(u64 n, const std::vector<i64> &primes);
u64 sigma_from_factorization(const Factorization &f);

static inline double abundancy_index(i64 sigma_n, i64 n) {
    return (double)sigma_n / (double)n;
}

static inline bool is_perfect(i64 sigma_n, i64 n) {
    return sigma_n == 2 * n;
}

struct NearMiss {
    i64 n;
    i64 sigma;
    i64 abs_deviation;   // |sigma(n) - 2n|
    double rel_deviation; // |sigma(n)/n - 2|
};

// top_k non-perfect n in [1, sigma.size()) closest to perfection
std::vector<NearMiss> near_misses(const std::vector<i64> &sigma, size_t top_k);

// 2^(p-1) * (2^p - 1)
cpp_int even_perfect_from_exponent(unsigned p);

// Necessary conditions on an odd perfect number
static inline bool touchard_congruence(i64 n) {
    return n % 12 == 1 || n % 36 == 9;
}
// n = q^a * m^2 with q prime, q == a == 1 (mod 4)
bool euler_form_possible(u64 n, const std::vector<u32> &spf);

} // namespace PrimeLab
