#pragma once
#include "types.hpp"
#include <string>
#include <utility>
#include <vector>

namespace PrimeLab {

// Korselt's criterion; returns (is Carmichael, smallest prime factor)
std::pair<bool, u64> is_carmichael(u64 n, const std::vector<i64> &primes);

cpp_int fermat_number(unsigned m);
cpp_int repunit(unsigned k);
cpp_int factorial(unsigned n);
cpp_int primorial(unsigned k, const std::vector<i64> &primes);

// Mirror decimal digits of x: even -> "123321", odd -> "12321"
u64 make_palindrome(u64 x, bool even);

// false iff some p covers every residue class mod p
bool is_admissible(const std::vector<i64> &offsets, const std::vector<i64> &primes);

// Primes p <= x with p + o prime for every offset o; mask must cover x + max(offset)
i64 count_pattern_occurrences(const std::vector<i64> &pattern, const std::vector<char> &mask, i64 x);

// None of n!+2, ..., n!+n is prime
bool prime_free_run_verified(unsigned n);

// a*n^2 + b*n + c
struct QuadraticPoly {
    std::string label;
    i64 a, b, c;

    i64 operator()(i64 n) const { return a * n * n + b * n + c; }
};

struct PolyPrimeRun {
    i64 run_length;        // consecutive prime values from n = 0
    i64 first_composite_n; // -1 if none in range
    i64 first_composite_value;
};

PolyPrimeRun poly_prime_run(const QuadraticPoly &f, i64 n_max, const std::vector<char> &mask);

} // namespace PrimeLab
