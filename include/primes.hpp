#pragma once
#include "types.hpp"
#include <vector>

namespace PrimeLab {

// mask[k] != 0 iff k is prime, for k = 0..n
std::vector<char> prime_mask_up_to(i64 n);
std::vector<i64> primes_up_to(i64 n);
std::vector<i64> primes_from_mask(const std::vector<char> &mask);

// pi[x] = number of primes <= x
std::vector<i64> pi_array_from_mask(const std::vector<char> &mask);

// Smallest prime factor of k for k = 0..n (spf[0] = spf[1] = 0)
std::vector<u32> spf_sieve(i64 n);

// Primes in [lo, hi] using a segmented sieve of width segment_size
std::vector<i64> primes_in_range(i64 lo, i64 hi, i64 segment_size);
i64 count_primes_segmented(i64 n, i64 segment_size);

} // namespace PrimeLab
