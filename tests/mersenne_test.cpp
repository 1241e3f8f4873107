// tests/mersenne_test.cpp

#include <gtest/gtest.h>
#include "mersenne.hpp"
#include "primes.hpp"

using namespace PrimeLab;

TEST(MersenneTest, LucasLehmerFindsKnownExponents) {
    std::vector<i64> found;
    for (i64 p : primes_up_to(130)) {
        if (lucas_lehmer_is_prime((unsigned)p)) found.push_back(p);
    }
    EXPECT_EQ(found, (std::vector<i64>{2, 3, 5, 7, 13, 17, 19, 31, 61, 89, 107, 127}));
    EXPECT_TRUE(lucas_lehmer_is_prime(521));
    EXPECT_FALSE(lucas_lehmer_is_prime(523));
    EXPECT_THROW(lucas_lehmer_is_prime(1), std::invalid_argument);
}

TEST(MersenneTest, NumberAndDigits) {
    EXPECT_EQ(mersenne_number(7), cpp_int(127));
    EXPECT_EQ(mersenne_digits(1), 1);
    EXPECT_EQ(mersenne_digits(10), 4);
    EXPECT_EQ(mersenne_digits(127), 39);
    EXPECT_EQ((i64)mersenne_number(127).str().size(), mersenne_digits(127));
    EXPECT_THROW(mersenne_digits(0), std::invalid_argument);
}

TEST(MersenneTest, SmallFactorSearch) {
    EXPECT_EQ(find_small_factor_for_mersenne(11, 100), std::optional<u64>(23));
    EXPECT_EQ(find_small_factor_for_mersenne(23, 100), std::optional<u64>(47));
    EXPECT_FALSE(find_small_factor_for_mersenne(13, 8000).has_value());
    EXPECT_FALSE(find_small_factor_for_mersenne(2, 100).has_value());
    EXPECT_FALSE(find_small_factor_for_mersenne(11, 22).has_value());

    auto mask = prime_mask_up_to(100);
    EXPECT_EQ(find_small_factor_for_mersenne(11, 100, &mask), std::optional<u64>(23));
    EXPECT_THROW(find_small_factor_for_mersenne(11, 200, &mask), std::invalid_argument);
}

TEST(MersenneTest, HeuristicDecreases) {
    EXPECT_GT(mersenne_prime_expectation(3), mersenne_prime_expectation(5));
    EXPECT_NEAR(mersenne_prime_expectation(100), 1.0 / (100 * 0.6931471805599453), 1e-12);
}
