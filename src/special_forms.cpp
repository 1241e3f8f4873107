#include "special_forms.hpp"
#include "factorization.hpp"
#include "primality.hpp"
#include <algorithm>
#include <set>
#include <stdexcept>

namespace PrimeLab {

std::pair<bool, u64> is_carmichael(u64 n, const std::vector<i64> &primes) {
    if (n < 3) {
        throw std::invalid_argument("is_carmichael(): n must be >= 3");
    }
    Factorization f = factorize_trial_division(n, primes);

    if (f.size() == 1 && f.begin()->first == n) return {false, n};

    const u64 smallest = f.begin()->first;
    for (const auto &[p, e] : f) {
        if (e != 1) return {false, smallest};
    }
    for (const auto &[p, e] : f) {
        if ((n - 1) % (p - 1) != 0) return {false, smallest};
    }
    return {true, smallest};
}

cpp_int fermat_number(unsigned m) {
    if (m > 24) {
        throw std::invalid_argument("fermat_number(): m too large");
    }
    return (cpp_int(1) << (1u << m)) + 1;
}

cpp_int repunit(unsigned k) {
    cpp_int r = 0;
    for (unsigned i = 0; i < k; ++i) r = r * 10 + 1;
    return r;
}

cpp_int factorial(unsigned n) {
    cpp_int f = 1;
    for (unsigned k = 2; k <= n; ++k) f *= k;
    return f;
}

cpp_int primorial(unsigned k, const std::vector<i64> &primes) {
    if (k > primes.size()) {
        throw std::invalid_argument("primorial(): need " + std::to_string(k) + " primes, got " +
                                    std::to_string(primes.size()));
    }
    cpp_int prod = 1;
    for (unsigned i = 0; i < k; ++i) prod *= primes[i];
    return prod;
}

u64 make_palindrome(u64 x, bool even) {
    std::string s = std::to_string(x);
    std::string tail(s.rbegin() + (even ? 0 : 1), s.rend());
    return std::stoull(s + tail);
}

bool is_admissible(const std::vector<i64> &offsets, const std::vector<i64> &primes) {
    for (i64 p : primes) {
        std::set<i64> residues;
        for (i64 o : offsets) residues.insert(((o % p) + p) % p);
        if ((i64)residues.size() == p) return false;
    }
    return true;
}

i64 count_pattern_occurrences(const std::vector<i64> &pattern, const std::vector<char> &mask, i64 x) {
    if (pattern.empty()) return 0;
    const i64 reach = x + *std::max_element(pattern.begin(), pattern.end());
    if (reach >= (i64)mask.size()) {
        throw std::invalid_argument("count_pattern_occurrences(): mask does not cover x + max(offset)");
    }
    i64 count = 0;
    for (i64 p = 2; p <= x; ++p) {
        if (!mask[p]) continue;
        bool ok = true;
        for (i64 o : pattern) {
            if (!mask[p + o]) {
                ok = false;
                break;
            }
        }
        if (ok) ++count;
    }
    return count;
}

bool prime_free_run_verified(unsigned n) {
    const cpp_int base = factorial(n);
    for (unsigned k = 2; k <= n; ++k) {
        if (is_prime_deterministic_64(cpp_int(base + k))) return false;
    }
    return true;
}

PolyPrimeRun poly_prime_run(const QuadraticPoly &f, i64 n_max, const std::vector<char> &mask) {
    PolyPrimeRun r{0, -1, 0};
    for (i64 n = 0; n <= n_max; ++n) {
        i64 v = f(n);
        if (v >= (i64)mask.size()) {
            throw std::invalid_argument("poly_prime_run(): mask too short for " + f.label);
        }
        bool prime = v >= 2 && mask[v];
        if (!prime) {
            r.first_composite_n = n;
            r.first_composite_value = v;
            break;
        }
        ++r.run_length;
    }
    return r;
}

} // namespace PrimeLab
