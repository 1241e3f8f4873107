// tests/modular_arithmetic_test.cpp

#include <gtest/gtest.h>
#include "modular_arithmetic.hpp"

using namespace PrimeLab;

TEST(ModularArithmeticTest, PowmodSmall) {
    EXPECT_EQ(powmod_u64(2, 10, 1000), 24u);
    EXPECT_EQ(powmod_u64(7, 0, 13), 1u);
    EXPECT_EQ(powmod_u64(5, 3, 1), 0u);
}

TEST(ModularArithmeticTest, MulmodDoesNotOverflow) {
    const u64 m = ~0ull;  // 2^64 - 1
    EXPECT_EQ(mulmod_u64(1ull << 63, 2, m), 1u);
    EXPECT_EQ(mulmod_u64(m - 1, m - 1, m), 1u);
}

TEST(ModularArithmeticTest, ZeroModulusThrows) {
    EXPECT_THROW(mulmod_u64(1, 2, 0), std::invalid_argument);
    EXPECT_THROW(powmod_u64(1, 2, 0), std::invalid_argument);
    EXPECT_THROW(modinv_u64(3, 0), std::invalid_argument);
}

TEST(ModularArithmeticTest, ModularInverse) {
    EXPECT_EQ(modinv_u64(3, 11), 4u);
    EXPECT_EQ(modinv_u64(10, 17), 12u);
    for (u64 a = 1; a < 101; ++a) {
        EXPECT_EQ(mulmod_u64(a, modinv_u64(a, 101), 101), 1u) << "a=" << a;
    }
    EXPECT_THROW(modinv_u64(2, 4), std::runtime_error);
}

TEST(ModularArithmeticTest, ExtendedGcdBezout) {
    long long x = 0, y = 0;
    long long g = egcd(240, 46, x, y);
    EXPECT_EQ(g, 2);
    EXPECT_EQ(240 * x + 46 * y, g);
    EXPECT_EQ(gcd_u64(240, 46), 2u);

    for (long long a = 0; a <= 60; a += 7) {
        for (long long b = 1; b <= 60; b += 5) {
            g = egcd(a, b, x, y);
            EXPECT_EQ((long long)gcd_u64((u64)a, (u64)b), g) << a << "," << b;
            EXPECT_EQ(a * x + b * y, g) << a << "," << b;
        }
    }
}

TEST(ModularArithmeticTest, ModularInverseNear63Bits) {
    const u64 p = 4611686018427387847ull;  // 2^62 - 57, prime
    for (u64 a : {2ull, 3ull, 123456789ull, p - 1}) {
        EXPECT_EQ(mulmod_u64(a, modinv_u64(a, p), p), 1u) << "a=" << a;
    }
    EXPECT_EQ(modinv_u64(p + 2, p), modinv_u64(2, p));
    EXPECT_THROW(modinv_u64(5, 1ull << 63), std::invalid_argument);
}

TEST(ModularArithmeticTest, BigPowmodMatchesNative) {
    const u64 m = 1000000007ull;
    EXPECT_EQ(powmod(cpp_int(2), cpp_int(100), cpp_int(m)), cpp_int(powmod_u64(2, 100, m)));
    EXPECT_EQ(powmod(cpp_int(-2), cpp_int(3), cpp_int(7)), cpp_int(6));
    EXPECT_THROW(powmod(cpp_int(2), cpp_int(-1), cpp_int(7)), std::invalid_argument);
    EXPECT_THROW(powmod(cpp_int(2), cpp_int(3), cpp_int(0)), std::invalid_argument);
}

TEST(ModularArithmeticTest, JacobiSymbolKnownValues) {
    EXPECT_EQ(jacobi_symbol(2, 7), 1);
    EXPECT_EQ(jacobi_symbol(3, 7), -1);
    EXPECT_EQ(jacobi_symbol(5, 15), 0);
    EXPECT_EQ(jacobi_symbol(2, 15), 1);
    EXPECT_EQ(jacobi_symbol(-1, 7), -1);
    EXPECT_EQ(jacobi_symbol(0, 1), 1);
    EXPECT_THROW(jacobi_symbol(3, 8), std::invalid_argument);
    EXPECT_THROW(jacobi_symbol(3, -5), std::invalid_argument);
}

TEST(ModularArithmeticTest, JacobiBigAgreesWithNative) {
    for (i64 n = 1; n < 200; n += 2) {
        for (i64 a = -20; a < 60; ++a) {
            EXPECT_EQ(jacobi_symbol(cpp_int(a), cpp_int(n)), jacobi_symbol(a, n)) << a << "/" << n;
        }
    }
}

TEST(ModularArithmeticTest, JacobiMatchesEulerCriterionForPrimes) {
    const i64 p = 1009;
    for (i64 a = 1; a < p; ++a) {
        u64 e = powmod_u64((u64)a, (p - 1) / 2, p);
        int expected = e == 1 ? 1 : -1;
        EXPECT_EQ(jacobi_symbol(a, p), expected);
    }
}
