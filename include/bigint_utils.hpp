#pragma once
#include "types.hpp"
#include <limits>
#include <stdexcept>
#include <string>

namespace PrimeLab {

static inline cpp_int read_big_decimal(const std::string &s) {
    size_t i = 0;
    bool neg = false;
    if (!s.empty() && s[0] == '-') { neg = true; i = 1; }
    if (i == s.size()) {
        throw std::invalid_argument("read_big_decimal(): empty number");
    }
    cpp_int N = 0;
    for (; i < s.size(); ++i) {
        char ch = s[i];
        if (ch < '0' || ch > '9') {
            throw std::invalid_argument("read_big_decimal(): not a decimal integer: '" + s + "'");
        }
        N = N * 10 + (ch - '0');
    }
    return neg ? cpp_int(-N) : N;
}

static inline size_t bitlen(const cpp_int &x) {
    if (x <= 0) return 0;
    return boost::multiprecision::msb(x) + 1;
}

static inline size_t decimal_digits(const cpp_int &x) {
    cpp_int t = x < 0 ? cpp_int(-x) : x;
    size_t digits = 1;
    while (t >= 10) {
        t /= 10;
        ++digits;
    }
    return digits;
}

static inline bool fits_u64(const cpp_int &x) {
    return x >= 0 && x <= cpp_int(std::numeric_limits<u64>::max());
}

} // namespace PrimeLab
