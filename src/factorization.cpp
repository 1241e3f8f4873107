#include "factorization.hpp"
#include "primelab_config.hpp"
#include "primality.hpp"
#include "modular_arithmetic.hpp"
#include "bigint_utils.hpp"
#include <algorithm>
#include <boost/multiprecision/integer.hpp>
#include <stdexcept>

namespace PrimeLab {

std::optional<std::pair<u64, unsigned>> trial_division_factor(u64 n, const std::vector<i64> &primes) {
    if (n < 2) {
        throw std::invalid_argument("trial_division_factor(): n must be >= 2");
    }
    u64 remaining = n;
    for (i64 p : primes) {
        u64 q = (u64)p;
        if ((u128)q * q > remaining) break;
        if (remaining % q == 0) {
            unsigned e = 0;
            while (remaining % q == 0) {
                remaining /= q;
                ++e;
            }
            return std::make_pair(q, e);
        }
    }
    return std::nullopt;
}

Factorization factorize_trial_division(u64 n, const std::vector<i64> &primes) {
    if (n < 2) {
        throw std::invalid_argument("factorize_trial_division(): n must be >= 2");
    }
    Factorization out;
    u64 remaining = n;
    for (i64 p : primes) {
        u64 q = (u64)p;
        if ((u128)q * q > remaining) break;
        while (remaining % q == 0) {
            remaining /= q;
            ++out[q];
        }
    }
    if (remaining > 1) ++out[remaining];
    return out;
}

Factorization factorize_with_spf(u64 n, const std::vector<u32> &spf) {
    if (n < 1) {
        throw std::invalid_argument("factorize_with_spf(): n must be >= 1");
    }
    Factorization out;
    u64 x = n;
    while (x > 1 && x < spf.size()) {
        u64 p = spf[x];
        if (p == 0) break;
        while (x % p == 0) {
            x /= p;
            ++out[p];
        }
    }
    if (x > 1) ++out[x];
    return out;
}

// f(v) = v^2 + c mod n
static inline u64 rho_step(u64 v, u64 c, u64 n) {
    return (u64)(((u128)mulmod_u64(v, v, n) + c) % n);
}

u64 pollard_rho(u64 n, Rng &rng) {
    if (n < 4) {
        throw std::invalid_argument("pollard_rho(): n must be composite (n >= 4)");
    }
    if (n % 2 == 0) return 2;
    if (n % 3 == 0) return 3;
    if (is_prime_deterministic_64(n)) {
        throw std::invalid_argument("pollard_rho(): n is prime");
    }

    for (int attempt = 0; attempt < RHO_MAX_RESTARTS; ++attempt) {
        u64 c = uniform_u64(rng, 1, n - 1);
        u64 x = uniform_u64(rng, 0, n - 1);
        u64 y = x;
        u64 d = 1;
        while (d == 1) {
            x = rho_step(x, c, n);
            y = rho_step(rho_step(y, c, n), c, n);
            d = gcd_u64(x > y ? x - y : y - x, n);
        }
        if (d != n) return d;
    }
    throw std::runtime_error("pollard_rho(): no factor found after " +
                             std::to_string(RHO_MAX_RESTARTS) + " restarts");
}

cpp_int pollard_rho(const cpp_int &n, Rng &rng) {
    if (n < 4) {
        throw std::invalid_argument("pollard_rho(): n must be composite (n >= 4)");
    }
    if (fits_u64(n)) return cpp_int(pollard_rho(n.convert_to<u64>(), rng));
    if ((n & 1) == 0) return 2;
    if (n % 3 == 0) return 3;
    if (is_prime_deterministic_64(n)) {
        throw std::invalid_argument("pollard_rho(): n is a probable prime");
    }

    for (int attempt = 0; attempt < RHO_MAX_RESTARTS; ++attempt) {
        cpp_int c = uniform_big(rng, 1, n - 1);
        cpp_int x = uniform_big(rng, 0, n - 1);
        cpp_int y = x;
        cpp_int d = 1;
        while (d == 1) {
            x = (x * x + c) % n;
            y = (y * y + c) % n;
            y = (y * y + c) % n;
            cpp_int diff = x > y ? cpp_int(x - y) : cpp_int(y - x);
            d = boost::multiprecision::gcd(diff, n);
        }
        if (d != n) return d;
    }
    throw std::runtime_error("pollard_rho(): no factor found after " +
                             std::to_string(RHO_MAX_RESTARTS) + " restarts");
}

static void rho_split(u64 m, Rng &rng, std::vector<u64> &out) {
    if (m == 1) return;
    if (is_prime_deterministic_64(m)) {
        out.push_back(m);
        return;
    }
    u64 d = pollard_rho(m, rng);
    rho_split(d, rng, out);
    rho_split(m / d, rng, out);
}

static void rho_split(const cpp_int &m, Rng &rng, std::vector<cpp_int> &out) {
    if (m == 1) return;
    if (fits_u64(m)) {
        std::vector<u64> small;
        rho_split(m.convert_to<u64>(), rng, small);
        for (u64 p : small) out.push_back(cpp_int(p));
        return;
    }
    if (is_prime_deterministic_64(m)) {
        out.push_back(m);
        return;
    }
    cpp_int d = pollard_rho(m, rng);
    rho_split(d, rng, out);
    rho_split(cpp_int(m / d), rng, out);
}

std::vector<u64> factorize_pollard_rho(u64 n, u64 seed) {
    std::vector<u64> factors;
    if (n < 2) return factors;
    Rng rng(seed);
    rho_split(n, rng, factors);
    return factors;
}

std::vector<cpp_int> factorize_pollard_rho(const cpp_int &n, u64 seed) {
    std::vector<cpp_int> factors;
    if (n < 2) return factors;
    Rng rng(seed);
    rho_split(n, rng, factors);
    return factors;
}

std::string format_factor_multiset(std::vector<cpp_int> factors) {
    if (factors.empty()) return "1";
    std::sort(factors.begin(), factors.end());
    std::string out;
    size_t i = 0;
    while (i < factors.size()) {
        const cpp_int p = factors[i];
        unsigned e = 0;
        while (i < factors.size() && factors[i] == p) {
            ++e;
            ++i;
        }
        if (!out.empty()) out += " · ";
        out += p.str();
        if (e > 1) out += "^" + std::to_string(e);
    }
    return out;
}

std::string format_factor_multiset(const std::vector<u64> &factors) {
    return format_factor_multiset(std::vector<cpp_int>(factors.begin(), factors.end()));
}

std::string format_factorization(const Factorization &f) {
    std::vector<cpp_int> factors;
    for (const auto &[p, e] : f) {
        factors.insert(factors.end(), e, cpp_int(p));
    }
    return format_factor_multiset(std::move(factors));
}

} // namespace PrimeLab
