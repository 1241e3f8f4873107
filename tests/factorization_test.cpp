// tests/factorization_test.cpp

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "factorization.hpp"
#include "primality.hpp"
#include "primes.hpp"

using namespace PrimeLab;
using ::testing::ElementsAre;
using ::testing::Pair;

class FactorizationTest : public ::testing::Test {
protected:
    std::vector<i64> primes = primes_up_to(1000);
};

TEST_F(FactorizationTest, TrialDivisionFactor) {
    auto f = trial_division_factor(360, primes);
    ASSERT_TRUE(f.has_value());
    EXPECT_EQ(f->first, 2u);
    EXPECT_EQ(f->second, 3u);
    EXPECT_FALSE(trial_division_factor(997, primes).has_value());
    EXPECT_THROW(trial_division_factor(1, primes), std::invalid_argument);
}

TEST_F(FactorizationTest, TrialDivisionFactorization) {
    EXPECT_THAT(factorize_trial_division(360, primes), ElementsAre(Pair(2u, 3u), Pair(3u, 2u), Pair(5u, 1u)));
    // cofactor above the prime list is kept as one factor
    EXPECT_THAT(factorize_trial_division(2ull * 1000003ull, primes), ElementsAre(Pair(2u, 1u), Pair(1000003u, 1u)));
}

TEST_F(FactorizationTest, SmallestPrimeFactorFactorization) {
    auto spf = spf_sieve(1000);
    EXPECT_EQ(factorize_with_spf(360, spf), factorize_trial_division(360, primes));
    EXPECT_TRUE(factorize_with_spf(1, spf).empty());
    EXPECT_THAT(factorize_with_spf(997, spf), ElementsAre(Pair(997u, 1u)));
}

TEST_F(FactorizationTest, PollardRhoFindsFactor) {
    Rng rng(1);
    EXPECT_EQ(pollard_rho(10, rng), 2u);
    EXPECT_EQ(pollard_rho(21, rng), 3u);
    u64 n = 10403;  // 101 * 103
    u64 d = pollard_rho(n, rng);
    EXPECT_TRUE(d == 101 || d == 103);
    EXPECT_THROW(pollard_rho(3, rng), std::invalid_argument);
    EXPECT_THROW(pollard_rho(1000003, rng), std::invalid_argument);
}

TEST_F(FactorizationTest, FactorizeProductInvariant) {
    const std::vector<u64> values = {2, 12, 360, 1001, 65537, 600851475143ull, 4294967297ull,
                                     1000000007ull * 3, 18446744073709551615ull};
    for (u64 n : values) {
        auto factors = factorize_pollard_rho(n, 3);
        u128 product = 1;
        for (u64 p : factors) {
            EXPECT_TRUE(is_prime_deterministic_64(p)) << p << " in " << n;
            product *= p;
        }
        EXPECT_EQ((u64)product, n);
    }
    EXPECT_TRUE(factorize_pollard_rho(1ull).empty());
}

TEST_F(FactorizationTest, FormatFactorMultiset) {
    EXPECT_EQ(format_factor_multiset(factorize_pollard_rho(600851475143ull)), "71 · 839 · 1471 · 6857");
    EXPECT_EQ(format_factor_multiset(std::vector<u64>{3, 2, 2}), "2^2 · 3");
    EXPECT_EQ(format_factor_multiset(std::vector<u64>{}), "1");
    EXPECT_EQ(format_factor_multiset(factorize_pollard_rho(4294967297ull)), "641 · 6700417");
    EXPECT_EQ(format_factorization(factorize_trial_division(360, primes)), "2^3 · 3^2 · 5");
}

TEST_F(FactorizationTest, BigIntegerFactorization) {
    const cpp_int f6 = (cpp_int(1) << 64) + 1;
    EXPECT_EQ(format_factor_multiset(factorize_pollard_rho(f6)), "274177 · 67280421310721");

    const cpp_int m67 = (cpp_int(1) << 67) - 1;
    auto factors = factorize_pollard_rho(m67, 5);
    cpp_int product = 1;
    for (const auto &p : factors) product *= p;
    EXPECT_EQ(product, m67);
    EXPECT_EQ(format_factor_multiset(factors), "193707721 · 761838257287");
}

TEST_F(FactorizationTest, SameSeedSameFactorOrder) {
    const u64 n = 999962000357ull;  // 999979 * 999983
    EXPECT_EQ(factorize_pollard_rho(n, 11), factorize_pollard_rho(n, 11));
}
