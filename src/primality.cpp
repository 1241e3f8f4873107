#include "primality.hpp"
#include "modular_arithmetic.hpp"
#include "bigint_utils.hpp"
#include <limits>
#include <stdexcept>

namespace PrimeLab {

const std::vector<u64> MR_BASES_64BIT_12 = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37};

static const u64 SMALL_PRIMES[] = {2, 3, 5, 7, 11, 13, 17, 19, 23, 29, 31, 37};

std::pair<u64, unsigned> decompose_n_minus_1(u64 n) {
    if (n < 3) {
        throw std::invalid_argument("decompose_n_minus_1(): n must be >= 3");
    }
    u64 d = n - 1;
    unsigned s = 0;
    while ((d & 1) == 0) {
        d >>= 1;
        ++s;
    }
    return {d, s};
}

std::pair<cpp_int, unsigned> decompose_n_minus_1(const cpp_int &n) {
    if (n < 3) {
        throw std::invalid_argument("decompose_n_minus_1(): n must be >= 3");
    }
    cpp_int d = n - 1;
    unsigned s = boost::multiprecision::lsb(d);
    d >>= s;
    return {d, s};
}

bool is_probable_prime_miller_rabin(u64 n, const std::vector<u64> &bases) {
    if (n < 2) return false;
    for (u64 p : SMALL_PRIMES) {
        if (n == p) return true;
    }
    for (u64 p : SMALL_PRIMES) {
        if (n % p == 0) return false;
    }

    auto [d, s] = decompose_n_minus_1(n);

    for (u64 a : bases) {
        u64 a_mod = a % n;
        if (a_mod == 0 || a_mod == 1) continue;

        u64 x = powmod_u64(a_mod, d, n);
        if (x == 1 || x == n - 1) continue;

        bool witness = true;
        for (unsigned r = 1; r < s; ++r) {
            x = mulmod_u64(x, x, n);
            if (x == n - 1) {
                witness = false;
                break;
            }
        }
        if (witness) return false;
    }
    return true;
}

bool is_probable_prime_miller_rabin(const cpp_int &n, const std::vector<u64> &bases) {
    if (fits_u64(n)) return is_probable_prime_miller_rabin(n.convert_to<u64>(), bases);
    if (n < 2) return false;
    for (u64 p : SMALL_PRIMES) {
        if (n % p == 0) return false;
    }

    auto [d, s] = decompose_n_minus_1(n);
    const cpp_int n_minus_1 = n - 1;

    for (u64 a : bases) {
        cpp_int a_mod = cpp_int(a) % n;
        if (a_mod == 0 || a_mod == 1) continue;

        cpp_int x = powmod(a_mod, d, n);
        if (x == 1 || x == n_minus_1) continue;

        bool witness = true;
        for (unsigned r = 1; r < s; ++r) {
            x = (x * x) % n;
            if (x == n_minus_1) {
                witness = false;
                break;
            }
        }
        if (witness) return false;
    }
    return true;
}

bool is_prime_deterministic_64(u64 n) {
    return is_probable_prime_miller_rabin(n, MR_BASES_64BIT_12);
}

bool is_prime_deterministic_64(const cpp_int &n) {
    return is_probable_prime_miller_rabin(n, MR_BASES_64BIT_12);
}

bool is_probable_prime_miller_rabin_random(const cpp_int &n, int rounds, Rng &rng) {
    if (rounds < 1) {
        throw std::invalid_argument("is_probable_prime_miller_rabin_random(): rounds must be >= 1");
    }
    if (n < 2) return false;
    for (u64 p : SMALL_PRIMES) {
        if (n == p) return true;
        if (n % p == 0) return false;
    }

    auto [d, s] = decompose_n_minus_1(n);
    const cpp_int n_minus_1 = n - 1;

    for (int round = 0; round < rounds; ++round) {
        cpp_int a = uniform_big(rng, 2, n - 2);
        cpp_int x = powmod(a, d, n);
        if (x == 1 || x == n_minus_1) continue;

        bool witness = true;
        for (unsigned r = 1; r < s; ++r) {
            x = (x * x) % n;
            if (x == n_minus_1) {
                witness = false;
                break;
            }
        }
        if (witness) return false;
    }
    return true;
}

bool is_probable_prime_solovay_strassen(u64 n, const std::vector<u64> &bases) {
    if (n < 2) return false;
    if (n == 2 || n == 3) return true;
    if ((n & 1) == 0) return false;
    if (n > (u64)std::numeric_limits<i64>::max()) {
        return is_probable_prime_solovay_strassen(cpp_int(n), bases);
    }

    for (u64 a : bases) {
        u64 a_mod = a % n;
        if (a_mod == 0 || a_mod == 1) continue;

        int j = jacobi_symbol((i64)a_mod, (i64)n);
        if (j == 0) return false;
        // Euler's criterion: a^((n-1)/2) == (a/n) (mod n)
        u64 y = powmod_u64(a_mod, (n - 1) / 2, n);
        u64 expected = (j == 1) ? 1 : n - 1;
        if (y != expected) return false;
    }
    return true;
}

bool is_probable_prime_solovay_strassen(const cpp_int &n, const std::vector<u64> &bases) {
    if (n < 2) return false;
    if (n == 2 || n == 3) return true;
    if ((n & 1) == 0) return false;

    const cpp_int half = (n - 1) / 2;
    for (u64 a : bases) {
        cpp_int a_mod = cpp_int(a) % n;
        if (a_mod == 0 || a_mod == 1) continue;

        int j = jacobi_symbol(a_mod, n);
        if (j == 0) return false;
        cpp_int y = powmod(a_mod, half, n);
        cpp_int expected = (j == 1) ? cpp_int(1) : cpp_int(n - 1);
        if (y != expected) return false;
    }
    return true;
}

bool trial_division_is_prime(u64 n, const std::vector<i64> &primes) {
    if (n < 2) return false;
    for (i64 p : primes) {
        u64 q = (u64)p;
        if ((u128)q * q > n) break;
        if (n % q == 0) return n == q;
    }
    return true;
}

bool is_fermat_probable_prime(u64 n, u64 base) {
    if (n < 2) return false;
    return powmod_u64(base, n - 1, n) == 1;
}

u64 wilson_factorial_mod(u64 n) {
    if (n == 0) {
        throw std::invalid_argument("wilson_factorial_mod(): n must be >= 1");
    }
    if (n == 1) return 0;
    u64 acc = 1;
    for (u64 k = 2; k < n; ++k) {
        acc = mulmod_u64(acc, k, n);
    }
    return acc;
}

} // namespace PrimeLab
