#pragma once
#include "types.hpp"
#include "random.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace PrimeLab {

using Factorization = std::map<u64, unsigned>;

// First (p, e) with p^e || n found while p*p <= n; nullopt if none
std::optional<std::pair<u64, unsigned>> trial_division_factor(u64 n, const std::vector<i64> &primes);

// Leftover cofactor > 1 is recorded as prime
Factorization factorize_trial_division(u64 n, const std::vector<i64> &primes);
Factorization factorize_with_spf(u64 n, const std::vector<u32> &spf);

// Non-trivial factor of composite n (not necessarily prime)
u64 pollard_rho(u64 n, Rng &rng);
cpp_int pollard_rho(const cpp_int &n, Rng &rng);

// Prime factors with multiplicity, unsorted
std::vector<u64> factorize_pollard_rho(u64 n, u64 seed = 1);
std::vector<cpp_int> factorize_pollard_rho(const cpp_int &n, u64 seed = 1);

// "3^2 · 5 · 17"; "1" for the empty product
std::string format_factor_multiset(std::vector<cpp_int> factors);
std::string format_factor_multiset(const std::vector<u64> &factors);
std::string format_factorization(const Factorization &f);

} // namespace PrimeLab
