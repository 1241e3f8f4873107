#include "random.hpp"
#include <stdexcept>

namespace PrimeLab {

u64 uniform_u64(Rng &rng, u64 lo, u64 hi) {
    if (lo > hi) {
        throw std::invalid_argument("uniform_u64(): empty range");
    }
    boost::random::uniform_int_distribution<u64> dist(lo, hi);
    return dist(rng);
}

cpp_int uniform_big(Rng &rng, const cpp_int &lo, const cpp_int &hi) {
    if (lo > hi) {
        throw std::invalid_argument("uniform_big(): empty range");
    }
    cpp_int width = hi - lo;
    if (width == 0) return lo;
    unsigned bits = boost::multiprecision::msb(width) + 1;
    unsigned limbs = (bits + 63) / 64;
    cpp_int mask = (cpp_int(1) << bits) - 1;
    // Rejection sampling on the smallest power of two covering the width
    for (;;) {
        cpp_int r = 0;
        for (unsigned i = 0; i < limbs; ++i) {
            r <<= 64;
            r += cpp_int((u64)rng());
        }
        r &= mask;
        if (r <= width) return lo + r;
    }
}

u64 random_bits_u64(Rng &rng, unsigned bits) {
    if (bits < 2 || bits > 64) {
        throw std::invalid_argument("random_bits_u64(): bits must be in [2, 64]");
    }
    u64 lo = 1ull << (bits - 1);
    u64 hi = (bits == 64) ? ~0ull : ((1ull << bits) - 1);
    return uniform_u64(rng, lo, hi);
}

u64 random_odd_bits_u64(Rng &rng, unsigned bits) {
    return random_bits_u64(rng, bits) | 1ull;
}

} // namespace PrimeLab
