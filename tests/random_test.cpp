// tests/random_test.cpp

#include <gtest/gtest.h>
#include "random.hpp"

using namespace PrimeLab;

TEST(RandomTest, SameSeedSameStream) {
    Rng a(42), b(42);
    for (int i = 0; i < 100; ++i) EXPECT_EQ(uniform_u64(a, 0, 1000), uniform_u64(b, 0, 1000));
}

TEST(RandomTest, UniformBigStaysInRange) {
    Rng rng(1);
    const cpp_int lo = cpp_int(1) << 70;
    const cpp_int hi = lo + 12345;
    for (int i = 0; i < 500; ++i) {
        cpp_int r = uniform_big(rng, lo, hi);
        EXPECT_GE(r, lo);
        EXPECT_LE(r, hi);
    }
    EXPECT_EQ(uniform_big(rng, cpp_int(5), cpp_int(5)), cpp_int(5));
    EXPECT_THROW(uniform_big(rng, cpp_int(6), cpp_int(5)), std::invalid_argument);
    EXPECT_THROW(uniform_u64(rng, 6, 5), std::invalid_argument);
}

TEST(RandomTest, RandomBitsHaveTopBitSet) {
    Rng rng(3);
    for (unsigned bits : {2u, 17u, 32u, 63u, 64u}) {
        for (int i = 0; i < 50; ++i) {
            u64 v = random_bits_u64(rng, bits);
            EXPECT_EQ(v >> (bits - 1), 1u) << "bits=" << bits;
            EXPECT_EQ(random_odd_bits_u64(rng, bits) & 1u, 1u);
        }
    }
    EXPECT_THROW(random_bits_u64(rng, 1), std::invalid_argument);
    EXPECT_THROW(random_bits_u64(rng, 65), std::invalid_argument);
}
