#pragma once
#include "types.hpp"
#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_int_distribution.hpp>

namespace PrimeLab {

using Rng = boost::random::mt19937_64;

// Uniform integer in [lo, hi] (inclusive)
u64 uniform_u64(Rng &rng, u64 lo, u64 hi);
cpp_int uniform_big(Rng &rng, const cpp_int &lo, const cpp_int &hi);

// Uniform integer with exactly `bits` bits (top bit set)
u64 random_bits_u64(Rng &rng, unsigned bits);
u64 random_odd_bits_u64(Rng &rng, unsigned bits);

} // namespace PrimeLab
