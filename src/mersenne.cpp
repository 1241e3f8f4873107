#include "mersenne.hpp"
#include "primelab_config.hpp"
#include "modular_arithmetic.hpp"
#include <cmath>
#include <stdexcept>

namespace PrimeLab {

cpp_int mersenne_number(unsigned p) {
    return (cpp_int(1) << p) - 1;
}

bool lucas_lehmer_is_prime(unsigned p) {
    if (p < 2) {
        throw std::invalid_argument("lucas_lehmer_is_prime(): p must be >= 2");
    }
    if (p == 2) return true;

    const cpp_int mp = mersenne_number(p);
    cpp_int s = 4;
    for (unsigned i = 0; i < p - 2; ++i) {
        s = s * s - 2;
        if (s < 0) s += mp;
#if LL_FAST_REDUCTION
        // x mod 2^p - 1 == (x & M_p) + (x >> p)
        while (s > mp) {
            s = (s & mp) + (s >> p);
        }
        if (s == mp) s = 0;
#else
        s %= mp;
#endif
    }
    return s == 0;
}

i64 mersenne_digits(i64 n) {
    if (n < 1) {
        throw std::invalid_argument("mersenne_digits(): n must be >= 1");
    }
    return (i64)std::floor((double)n * std::log10(2.0)) + 1;
}

std::optional<u64> find_small_factor_for_mersenne(unsigned p, u64 q_max,
                                                  const std::vector<char> *prime_mask) {
    if (p == 2) return std::nullopt;
    if (prime_mask && prime_mask->size() < q_max + 1) {
        throw std::invalid_argument("find_small_factor_for_mersenne(): prime mask shorter than q_max + 1");
    }
    const u64 step = 2ull * p;
    if (q_max < 1) return std::nullopt;
    const u64 k_max = (q_max - 1) / step;
    for (u64 k = 1; k <= k_max; ++k) {
        u64 q = step * k + 1;
        if (prime_mask && !(*prime_mask)[q]) continue;
        if (powmod_u64(2, p, q) == 1) return q;
    }
    return std::nullopt;
}

double mersenne_prime_expectation(unsigned p) {
    return 1.0 / ((double)p * std::log(2.0));
}

} // namespace PrimeLab
