#pragma once
#include "types.hpp"
#include <stdexcept>

namespace PrimeLab {

u64 mulmod_u64(u64 a, u64 b, u64 m);
u64 powmod_u64(u64 base, u64 exp, u64 m);
u64 gcd_u64(u64 a, u64 b);

long long egcd(long long a, long long b, long long &x, long long &y);
u64 modinv_u64(u64 a, u64 m);

cpp_int powmod(const cpp_int &base, const cpp_int &exp, const cpp_int &m);

// Jacobi symbol (a/n) for odd n > 0; returns -1, 0 or +1
int jacobi_symbol(i64 a, i64 n);
int jacobi_symbol(cpp_int a, cpp_int n);

} // namespace PrimeLab
