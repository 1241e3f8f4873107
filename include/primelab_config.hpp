#pragma once

// ===== Project-wide switches (override with -DNAME=value) =====

// Largest bound accepted by any sieve
#ifndef SIEVE_MAX
#define SIEVE_MAX 1000000000LL
#endif

// Seed used when --seed is not given
#ifndef DEFAULT_SEED
#define DEFAULT_SEED 1
#endif

// Pollard rho gives up after this many (c, x0) restarts
#ifndef RHO_MAX_RESTARTS
#define RHO_MAX_RESTARTS 256
#endif

// Lucas-Lehmer reduces mod 2^p - 1 with shift/mask instead of %
#ifndef LL_FAST_REDUCTION
#define LL_FAST_REDUCTION 1
#endif
