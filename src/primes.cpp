#include "primes.hpp"
#include "primelab_config.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace PrimeLab {

static void check_sieve_bound(const char *fn, i64 n) {
    if (n < 0) {
        throw std::invalid_argument(std::string(fn) + "(): n must be >= 0");
    }
    if (n > (i64)SIEVE_MAX) {
        throw std::invalid_argument(std::string(fn) + "(): n exceeds SIEVE_MAX (" +
                                    std::to_string((i64)SIEVE_MAX) + ")");
    }
}

std::vector<char> prime_mask_up_to(i64 n) {
    check_sieve_bound("prime_mask_up_to", n);
    std::vector<char> is(n + 1, 1);
    is[0] = 0;
    if (n >= 1) is[1] = 0;

    for (i64 p = 2; p * p <= n; ++p) {
        if (is[p]) {
            for (i64 q = p * p; q <= n; q += p) {
                is[q] = 0;
            }
        }
    }
    return is;
}

std::vector<i64> primes_from_mask(const std::vector<char> &mask) {
    std::vector<i64> out;
    out.reserve(mask.size() / 10 + 16);
    for (size_t i = 2; i < mask.size(); ++i) {
        if (mask[i]) out.push_back((i64)i);
    }
    return out;
}

std::vector<i64> primes_up_to(i64 n) {
    if (n < 2) return {};
    return primes_from_mask(prime_mask_up_to(n));
}

std::vector<i64> pi_array_from_mask(const std::vector<char> &mask) {
    std::vector<i64> pi(mask.size());
    i64 acc = 0;
    for (size_t i = 0; i < mask.size(); ++i) {
        if (mask[i]) ++acc;
        pi[i] = acc;
    }
    return pi;
}

std::vector<u32> spf_sieve(i64 n) {
    check_sieve_bound("spf_sieve", n);
    std::vector<u32> spf(n + 1, 0);
    for (i64 i = 2; i <= n; ++i) {
        if (spf[i] != 0) continue;
        spf[i] = (u32)i;
        if (i * i > n) continue;
        for (i64 j = i * i; j <= n; j += i) {
            if (spf[j] == 0) spf[j] = (u32)i;
        }
    }
    return spf;
}

std::vector<i64> primes_in_range(i64 lo, i64 hi, i64 segment_size) {
    if (segment_size <= 0) {
        throw std::invalid_argument("primes_in_range(): segment_size must be positive");
    }
    if (lo < 2) lo = 2;
    if (lo > hi) return {};
    check_sieve_bound("primes_in_range", hi);

    i64 root = 1;
    while ((root + 1) * (root + 1) <= hi) ++root;
    const std::vector<i64> base = primes_up_to(root);

    std::vector<i64> out;
    std::vector<char> seg;
    for (i64 start = lo; start <= hi; start += segment_size) {
        i64 end = std::min(hi, start + segment_size - 1);
        seg.assign(end - start + 1, 1);
        for (i64 p : base) {
            if (p * p > end) break;
            i64 first = std::max(p * p, ((start + p - 1) / p) * p);
            for (i64 q = first; q <= end; q += p) {
                seg[q - start] = 0;
            }
        }
        for (i64 i = 0; i < (i64)seg.size(); ++i) {
            if (seg[i]) out.push_back(start + i);
        }
    }
    return out;
}

i64 count_primes_segmented(i64 n, i64 segment_size) {
    if (segment_size <= 0) {
        throw std::invalid_argument("count_primes_segmented(): segment_size must be positive");
    }
    check_sieve_bound("count_primes_segmented", n);
    if (n < 2) return 0;

    i64 root = 1;
    while ((root + 1) * (root + 1) <= n) ++root;
    const std::vector<i64> base = primes_up_to(root);

    i64 count = 0;
    std::vector<char> seg;
    for (i64 start = 2; start <= n; start += segment_size) {
        i64 end = std::min(n, start + segment_size - 1);
        seg.assign(end - start + 1, 1);
        for (i64 p : base) {
            if (p * p > end) break;
            i64 first = std::max(p * p, ((start + p - 1) / p) * p);
            for (i64 q = first; q <= end; q += p) {
                seg[q - start] = 0;
            }
        }
        count += (i64)std::count(seg.begin(), seg.end(), (char)1);
    }
    return count;
}

} // namespace PrimeLab
