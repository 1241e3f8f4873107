#pragma once
#include "types.hpp"
#include <optional>
#include <vector>

namespace PrimeLab {

// 2^p - 1
cpp_int mersenne_number(unsigned p);

// Whether M_p is prime, for prime p (p = 2 is special-cased)
bool lucas_lehmer_is_prime(unsigned p);

// Decimal digits of 2^n - 1
i64 mersenne_digits(i64 n);

// Smallest q = 2pk + 1 <= q_max with q | M_p. With prime_mask set only prime q are tried.
std::optional<u64> find_small_factor_for_mersenne(unsigned p, u64 q_max,
                                                  const std::vector<char> *prime_mask = nullptr);

// Heuristic probability that M_p is prime
double mersenne_prime_expectation(unsigned p);

} // namespace PrimeLab
