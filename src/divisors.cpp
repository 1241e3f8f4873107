#include "divisors.hpp"
#include <limits>
#include <algorithm>
#include <stdexcept>

namespace PrimeLab {

std::vector<i64> sigma_sieve(i64 n) {
    if (n < 0) {
        throw std::invalid_argument("sigma_sieve(): n must be >= 0");
    }
    std::vector<i64> sigma(n + 1, 0);
    for (i64 d = 1; d <= n; ++d) {
        for (i64 k = d; k <= n; k += d) {
            sigma[k] += d;
        }
    }
    return sigma;
}

u64 sigma_from_factorization(const Factorization &f) {
    const u128 limit = std::numeric_limits<u64>::max();
    u128 total = 1;
    for (const auto &[p, a] : f) {
        // 1 + p + ... + p^a
        u128 term = 1, pk = 1;
        for (unsigned i = 0; i < a; ++i) {
            pk *= p;
            term += pk;
        }
        if (term > limit || (total *= term) > limit) {
            throw std::overflow_error("sigma_from_factorization(): sigma(n) does not fit in 64 bits");
        }
    }
    return (u64)total;
}

u64 sigma_from_factorization(u64 n, const std::vector<i64> &primes) {
    if (n < 1) {
        throw std::invalid_argument("sigma_from_factorization(): n must be >= 1");
    }
    if (n == 1) return 1;
    return sigma_from_factorization(factorize_trial_division(n, primes));
}

std::vector<NearMiss> near_misses(const std::vector<i64> &sigma, size_t top_k) {
    std::vector<NearMiss> all;
    all.reserve(sigma.size());
    for (size_t k = 1; k < sigma.size(); ++k) {
        i64 n = (i64)k;
        if (is_perfect(sigma[k], n)) continue;
        i64 dev = sigma[k] > 2 * n ? sigma[k] - 2 * n : 2 * n - sigma[k];
        double rel = abundancy_index(sigma[k], n) - 2.0;
        all.push_back({n, sigma[k], dev, rel < 0 ? -rel : rel});
    }
    auto closer = [](const NearMiss &a, const NearMiss &b) {
        return a.abs_deviation != b.abs_deviation ? a.abs_deviation < b.abs_deviation : a.n < b.n;
    };
    size_t k = std::min(top_k, all.size());
    std::partial_sort(all.begin(), all.begin() + k, all.end(), closer);
    all.resize(k);
    return all;
}

cpp_int even_perfect_from_exponent(unsigned p) {
    if (p < 2) {
        throw std::invalid_argument("even_perfect_from_exponent(): p must be >= 2");
    }
    return (cpp_int(1) << (p - 1)) * ((cpp_int(1) << p) - 1);
}

bool euler_form_possible(u64 n, const std::vector<u32> &spf) {
    Factorization f = factorize_with_spf(n, spf);
    u64 q = 0;
    unsigned a = 0;
    int odd_count = 0;
    for (const auto &[p, e] : f) {
        if (e % 2 == 1) {
            ++odd_count;
            q = p;
            a = e;
        }
    }
    if (odd_count != 1) return false;
    return q % 4 == 1 && a % 4 == 1;
}

} // namespace PrimeLab
