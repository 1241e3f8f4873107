#pragma once
#include <boost/multiprecision/cpp_int.hpp>

using u64  = unsigned long long;
using u128 = unsigned __int128;
using u32  = unsigned int;
using i64  = long long;

using boost::multiprecision::cpp_int;
