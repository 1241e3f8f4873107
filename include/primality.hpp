#pragma once
#include "types.hpp"
#include "random.hpp"
#include <utility>
#include <vector>

namespace PrimeLab {

// Deterministic for n < 2^64
extern const std::vector<u64> MR_BASES_64BIT_12;

// n - 1 = d * 2^s with d odd (n >= 3)
std::pair<u64, unsigned> decompose_n_minus_1(u64 n);
std::pair<cpp_int, unsigned> decompose_n_minus_1(const cpp_int &n);

bool is_probable_prime_miller_rabin(u64 n, const std::vector<u64> &bases);
bool is_probable_prime_miller_rabin(const cpp_int &n, const std::vector<u64> &bases);

bool is_prime_deterministic_64(u64 n);
bool is_prime_deterministic_64(const cpp_int &n);

// Miller-Rabin with `rounds` random bases drawn from [2, n-2]
bool is_probable_prime_miller_rabin_random(const cpp_int &n, int rounds, Rng &rng);

bool is_probable_prime_solovay_strassen(u64 n, const std::vector<u64> &bases);
bool is_probable_prime_solovay_strassen(const cpp_int &n, const std::vector<u64> &bases);

// Exact when primes covers sqrt(n)
bool trial_division_is_prime(u64 n, const std::vector<i64> &primes);

// base^(n-1) == 1 (mod n)
bool is_fermat_probable_prime(u64 n, u64 base);

// (n-1)! mod n by direct multiplication
u64 wilson_factorial_mod(u64 n);

} // namespace PrimeLab
