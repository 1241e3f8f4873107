#include "modular_arithmetic.hpp"
#include <boost/multiprecision/integer.hpp>
#include <limits>
#include <numeric>
#include <tuple>
#include <utility>

namespace PrimeLab {

u64 mulmod_u64(u64 a, u64 b, u64 m) {
    if (m == 0) {
        throw std::invalid_argument("mulmod_u64(): modulus is zero");
    }
    return (u64)(((u128)a * b) % m);
}

u64 powmod_u64(u64 base, u64 exp, u64 m) {
    if (m == 0) {
        throw std::invalid_argument("powmod_u64(): modulus is zero");
    }
    if (m == 1) return 0;
    u64 result = 1;
    base %= m;
    while (exp) {
        if (exp & 1) result = (u64)(((u128)result * base) % m);
        base = (u64)(((u128)base * base) % m);
        exp >>= 1;
    }
    return result;
}

u64 gcd_u64(u64 a, u64 b) {
    return std::gcd(a, b);
}

// Iterative extended Euclid: a*x + b*y = g
long long egcd(long long a, long long b, long long &x, long long &y) {
    long long x0 = 1, x1 = 0, y0 = 0, y1 = 1;
    while (b != 0) {
        const long long q = a / b;
        std::tie(a, b) = std::make_pair(b, a - q * b);
        std::tie(x0, x1) = std::make_pair(x1, x0 - q * x1);
        std::tie(y0, y1) = std::make_pair(y1, y0 - q * y1);
    }
    x = x0;
    y = y0;
    return a;
}

u64 modinv_u64(u64 a, u64 m) {
    if (m == 0) {
        throw std::invalid_argument("modinv_u64(): divide by zero");
    }
    if (m > (u64)std::numeric_limits<long long>::max()) {
        throw std::invalid_argument("modinv_u64(): modulus exceeds 63 bits");
    }
    long long x, y;
    long long g = egcd((long long)(a % m), (long long)m, x, y);
    if (g != 1) {
        throw std::runtime_error("modinv_u64(): inverse does not exist");
    }
    long long inv = x % (long long)m;
    if (inv < 0) inv += (long long)m;
    return (u64)inv;
}

cpp_int powmod(const cpp_int &base, const cpp_int &exp, const cpp_int &m) {
    if (m <= 0) {
        throw std::invalid_argument("powmod(): modulus must be positive");
    }
    if (exp < 0) {
        throw std::invalid_argument("powmod(): negative exponent");
    }
    if (m == 1) return 0;
    cpp_int b = base % m;
    if (b < 0) b += m;
    return boost::multiprecision::powm(b, exp, m);
}

int jacobi_symbol(i64 a, i64 n) {
    if (n <= 0 || n % 2 == 0) {
        throw std::invalid_argument("jacobi_symbol(): n must be a positive odd integer");
    }
    a %= n;
    if (a < 0) a += n;
    int result = 1;
    while (a != 0) {
        while (a % 2 == 0) {
            a /= 2;
            i64 r = n % 8;
            if (r == 3 || r == 5) result = -result;
        }
        std::swap(a, n);  // quadratic reciprocity
        if (a % 4 == 3 && n % 4 == 3) result = -result;
        a %= n;
    }
    return n == 1 ? result : 0;
}

int jacobi_symbol(cpp_int a, cpp_int n) {
    if (n <= 0 || (n & 1) == 0) {
        throw std::invalid_argument("jacobi_symbol(): n must be a positive odd integer");
    }
    a %= n;
    if (a < 0) a += n;
    int result = 1;
    while (a != 0) {
        unsigned twos = 0;
        while ((a & 1) == 0) {
            a >>= 1;
            ++twos;
        }
        unsigned r = cpp_int(n & 7).convert_to<unsigned>();
        if ((twos & 1) && (r == 3 || r == 5)) result = -result;
        a.swap(n);
        if ((a & 3) == 3 && (n & 3) == 3) result = -result;
        a %= n;
    }
    return n == 1 ? result : 0;
}

} // namespace PrimeLab
