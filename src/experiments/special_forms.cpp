#include "experiments.hpp"
#include "factorization.hpp"
#include "logger.hpp"
#include "primality.hpp"
#include "primes.hpp"
#include "random.hpp"
#include "special_forms.hpp"
#include "timing.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace PrimeLab {
namespace Experiments {

void run_e013(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 300);
    if (n_max < 0 || n_max > 1000000) {
        throw std::invalid_argument("e013: n_max must be in [0, 1000000]");
    }
    const std::vector<QuadraticPoly> polys = {
        {"n^2 + n + 41", 1, 1, 41},
        {"n^2 - n + 41", 1, -1, 41},
        {"n^2 + n + 17", 1, 1, 17},
    };

    i64 v_max = 2;
    for (const auto &f : polys) v_max = std::max({v_max, f(0), f(n_max)});
    const std::vector<char> mask = prime_mask_up_to(v_max);

    CsvWriter csv(ctx.data("polynomial_prime_indicator.csv"), {"n", "euler_41", "euler_41_shifted", "poly_17"});
    std::vector<i64> prime_counts(polys.size(), 0);
    for (i64 n = 0; n <= n_max; ++n) {
        int flags[3];
        for (size_t k = 0; k < polys.size(); ++k) {
            i64 v = polys[k](n);
            flags[k] = v >= 2 && mask[v] ? 1 : 0;
            prime_counts[k] += flags[k];
        }
        csv.row(n, flags[0], flags[1], flags[2]);
    }

    std::vector<std::vector<std::string>> rows;
    for (size_t k = 0; k < polys.size(); ++k) {
        const PolyPrimeRun run = poly_prime_run(polys[k], n_max, mask);
        std::string n_str = "—", value = "—", fac = "—";
        if (run.first_composite_n >= 0) {
            n_str = std::to_string(run.first_composite_n);
            value = std::to_string(run.first_composite_value);
            fac = format_factor_multiset(factorize_pollard_rho((u64)run.first_composite_value, ctx.seed));
        }
        rows.push_back({polys[k].label, std::to_string(run.run_length), n_str, value, fac,
                        fmt::format("{:.3f}", (double)prime_counts[k] / (double)(n_max + 1))});
    }

    ReportBuilder report(ctx.id, "Prime-polynomial counterexamples (Euler's n^2 + n + 41)", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Prime runs from n = 0")
        .table({"polynomial", "run length", "first composite n", "value", "factorization", "prime fraction"}, rows,
               "lrrrlr")
        .section("Notes")
        .bullet("A long initial run of primes is not a proof that a polynomial always yields primes.")
        .bullet("For n = 40, n^2 + n + 41 = 41^2, so the run must end there.")
        .bullet("No non-constant integer polynomial takes only prime values.")
        .outputs({"data/polynomial_prime_indicator.csv", "params.json", "report.md"})
        .write(ctx.paths.report_path);
}

void run_e014(ExperimentContext &ctx) {
    const i64 k_max = ctx.config.get<i64>("k_max", 30);
    if (k_max < 1 || k_max > 1000) {
        throw std::invalid_argument("e014: k_max must be in [1, 1000]");
    }

    const std::vector<i64> primes = primes_up_to(8000);
    CsvWriter csv(ctx.data("primorial_pm1.csv"), {"k", "p_k", "plus_is_prime", "minus_is_prime"});
    i64 first_plus = -1, first_minus = -1;
    cpp_int plus_value, minus_value;
    for (unsigned k = 1; k <= (unsigned)k_max; ++k) {
        const cpp_int prim = primorial(k, primes);
        const cpp_int plus = prim + 1, minus = prim - 1;
        bool plus_prime = is_prime_deterministic_64(plus);
        bool minus_prime = minus >= 2 && is_prime_deterministic_64(minus);
        csv.row(k, primes[k - 1], plus_prime ? 1 : 0, minus_prime ? 1 : 0);
        if (!plus_prime && first_plus < 0) {
            first_plus = k;
            plus_value = plus;
        }
        // primorial(1) - 1 = 1 is neither prime nor a counterexample
        if (!minus_prime && minus >= 2 && first_minus < 0) {
            first_minus = k;
            minus_value = minus;
        }
    }

    ReportBuilder report(ctx.id, "Primorial ± 1 counterexamples", ctx.reproduce);
    report.section("Parameters").param("k_max", std::to_string(k_max)).section("First composite examples").line();
    if (first_plus >= 0) {
        report.line(fmt::format("- first composite primorial(k)+1 at k={}: `{}` = {}", first_plus, plus_value.str(),
                                format_factor_multiset(factorize_pollard_rho(plus_value, ctx.seed))));
    }
    if (first_minus >= 0) {
        report.line(fmt::format("- first composite primorial(k)-1 at k={}: `{}` = {}", first_minus, minus_value.str(),
                                format_factor_multiset(factorize_pollard_rho(minus_value, ctx.seed))));
    }
    report.section("Notes")
        .bullet("Euclid's proof uses the idea `P+1` (where P is a product of primes) to show *some* new prime exists.")
        .bullet("It does **not** imply `P±1` is itself prime; composites appear very early.")
        .outputs({"data/primorial_pm1.csv", "params.json", "report.md"})
        .write(ctx.paths.report_path);
}

void run_e037(ExperimentContext &ctx) {
    const auto n_values = ctx.config.get<std::vector<i64>>("n_values", {10, 20, 30, 40, 50, 60, 80});

    CsvWriter csv(ctx.data("prime_free_intervals.csv"), {"n", "verified_length", "start_digits"});
    std::vector<std::vector<std::string>> rows;
    for (i64 n : n_values) {
        if (n < 2 || n > 2000) throw std::invalid_argument("e037: n_values must be in [2, 2000]");
        bool ok = prime_free_run_verified((unsigned)n);
        i64 length = ok ? n - 1 : 0;
        const size_t digits = factorial((unsigned)n).str().size();
        csv.row(n, length, digits);
        rows.push_back({std::to_string(n), std::to_string(length), std::to_string(digits)});
        if (!ok) LOG_ERROR("Found a prime in {}!+2..{}!+{}", n, n, n);
    }

    ReportBuilder report(ctx.id, "Prime-free intervals via factorial construction", ctx.reproduce);
    report.section("Parameters")
        .param("n_values", format_list(n_values))
        .section("Verified runs")
        .table({"n", "prime-free length", "digits of n!"}, rows, "rrr")
        .section("Notes")
        .bullet("For each n, the numbers n!+2, n!+3, ..., n!+n are divisible by 2,3,...,n respectively.")
        .bullet("This provides explicit long runs of composites (a counterexample to 'primes appear regularly').")
        .write(ctx.paths.report_path);
}

void run_e039(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 5000000);
    const i64 x_step = ctx.config.get<i64>("x_step", 200000);
    if (n_max < 2 || x_step < 1) {
        throw std::invalid_argument("e039: need n_max >= 2 and x_step >= 1");
    }

    const std::vector<char> mask = prime_mask_up_to(2 * n_max + 1);
    CsvWriter csv(ctx.data("sophie_germain_safe.csv"), {"x", "sophie_germain", "safe"});
    i64 sg = 0, safe = 0;
    std::vector<i64> first_sg, first_safe;
    i64 next_x = std::min(x_step, n_max);
    for (i64 p = 2; p <= n_max; ++p) {
        if (mask[p]) {
            if (mask[2 * p + 1]) {
                ++sg;
                if (first_sg.size() < 10) first_sg.push_back(p);
            }
            if (p > 2 && mask[(p - 1) / 2]) {
                ++safe;
                if (first_safe.size() < 10) first_safe.push_back(p);
            }
        }
        if (p == next_x) {
            csv.row(p, sg, safe);
            next_x = std::min(next_x + x_step, n_max);
            if (p == n_max) break;
        }
    }

    ReportBuilder report(ctx.id, "Sophie Germain and safe primes", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Counts up to n_max")
        .param("Sophie Germain primes p (2p+1 prime)", std::to_string(sg))
        .param("safe primes q ((q-1)/2 prime)", std::to_string(safe))
        .param("first Sophie Germain primes", format_list(first_sg))
        .param("first safe primes", format_list(first_safe))
        .section("Notes")
        .bullet("These prime families matter in cryptography and in prime pattern heuristics.")
        .bullet("Counts grow slowly; local fluctuations are visible at moderate x.")
        .write(ctx.paths.report_path);
}

void run_e040(ExperimentContext &ctx) {
    const i64 limit = ctx.config.get<i64>("limit", 50000);
    if (limit < 1 || limit > 99999999) {
        throw std::invalid_argument("e040: limit must be in [1, 99999999]");
    }

    CsvWriter csv(ctx.data("palindrome_primes.csv"), {"x", "even_palindrome", "even_is_prime", "odd_palindrome",
                                                      "odd_is_prime"});
    std::vector<i64> even_primes;
    i64 odd_primes = 0;
    for (i64 x = 1; x <= limit; ++x) {
        u64 pe = make_palindrome((u64)x, true);
        u64 po = make_palindrome((u64)x, false);
        bool e = is_prime_deterministic_64(pe);
        bool o = is_prime_deterministic_64(po);
        if (e) even_primes.push_back((i64)pe);
        odd_primes += o;
        csv.row(x, pe, e ? 1 : 0, po, o ? 1 : 0);
    }

    std::vector<i64> shown(even_primes.begin(), even_primes.begin() + std::min<size_t>(10, even_primes.size()));
    ReportBuilder report(ctx.id, "Palindromic primes and the '11 trap'", ctx.reproduce);
    report.section("Parameters")
        .param("limit", std::to_string(limit))
        .section("Results")
        .param("odd-length palindromic primes", std::to_string(odd_primes))
        .param("even-length palindromic primes", std::to_string(even_primes.size()))
        .section("Notes")
        .bullet("Every even-length base-10 palindrome is divisible by 11, hence composite (except 11 itself).")
        .line(fmt::format("- Even-length palindromic primes found in this scan: `{}`", format_list(shown)))
        .write(ctx.paths.report_path);
}

void run_e041(ExperimentContext &ctx) {
    const i64 m_max = ctx.config.get<i64>("m_max", 6);
    const i64 factor_m_max = ctx.config.get<i64>("factor_m_max", 6);
    if (m_max < 0 || m_max > 24) {
        throw std::invalid_argument("e041: m_max must be in [0, 24]");
    }

    CsvWriter csv(ctx.data("fermat_numbers.csv"), {"m", "bits", "is_prime"});
    std::vector<std::vector<std::string>> rows;
    for (unsigned m = 0; m <= (unsigned)m_max; ++m) {
        const cpp_int f = fermat_number(m);
        bool prime = is_prime_deterministic_64(f);
        csv.row(m, (1u << m) + 1, prime ? 1 : 0);

        std::string fac;
        if (prime) {
            fac = "prime";
        } else if ((i64)m <= factor_m_max) {
            auto t0 = now_tp();
            fac = format_factor_multiset(factorize_pollard_rho(f, ctx.seed));
            LOG_DEBUG("Factored F_{} in {:.1f} ms", m, ms_since(t0));
        } else {
            fac = "_composite, not factored_";
        }
        const std::string value = m <= 6 ? f.str() : fmt::format("2^{} + 1", 1u << m);
        rows.push_back({std::to_string(m), value, prime ? "1" : "0", fac});
    }

    ReportBuilder report(ctx.id, "Fermat numbers: prime for m<=4, composite afterwards", ctx.reproduce);
    report.section("Parameters")
        .param("m_max", std::to_string(m_max))
        .param("factor_m_max", std::to_string(factor_m_max))
        .section("Table")
        .table({"m", "F_m", "prime?", "factorization (if composite)"}, rows, "rrrl")
        .section("Notes")
        .bullet("Fermat conjectured all F_m are prime; F5 is famously composite.")
        .bullet("This experiment provides a clean counterexample table and factors (via rho).")
        .write(ctx.paths.report_path);
}

void run_e042(ExperimentContext &ctx) {
    const i64 k_max = ctx.config.get<i64>("k_max", 30);
    if (k_max < 1 || k_max > 2000) {
        throw std::invalid_argument("e042: k_max must be in [1, 2000]");
    }

    const std::vector<char> k_mask = prime_mask_up_to(k_max);
    CsvWriter csv(ctx.data("repunit_indicator.csv"), {"k", "k_is_prime", "probable_prime"});
    std::vector<i64> found;
    for (unsigned k = 1; k <= (unsigned)k_max; ++k) {
        bool pp = is_probable_prime_miller_rabin(repunit(k), MR_BASES_64BIT_12);
        csv.row(k, k_mask[k] ? 1 : 0, pp ? 1 : 0);
        if (pp) found.push_back(k);
        if (pp && !k_mask[k]) LOG_WARN("R_{} passed MR although {} is composite", k, k);
    }

    ReportBuilder report(ctx.id, "Repunit primes (small k scan)", ctx.reproduce);
    report.section("Parameters")
        .param("k_max", std::to_string(k_max))
        .section("Results")
        .param("k with R_k a probable prime", format_list(found))
        .section("Notes")
        .bullet("Repunit numbers grow fast; this experiment uses Miller–Rabin for a probable-prime indicator.")
        .bullet("Many k values produce composites; prime k is necessary (but not sufficient) for R_k to be prime.")
        .write(ctx.paths.report_path);
}

// Uniform over primes in [2^(bits-1), 2^bits)
static u64 random_prime_bits(Rng &rng, unsigned bits) {
    for (;;) {
        u64 c = random_bits_u64(rng, bits);
        if (is_prime_deterministic_64(c)) return c;
    }
}

void run_e043(ExperimentContext &ctx) {
    const i64 samples = ctx.config.get<i64>("samples", 80);
    const i64 bits = ctx.config.get<i64>("bits", 28);
    if (bits < 3 || bits > 32) {
        throw std::invalid_argument("e043: bits must be in [3, 32]");
    }

    Rng rng(ctx.seed);
    CsvWriter csv(ctx.data("pollard_rho_runtime.csv"), {"sample", "n", "p", "q", "time_ms"});
    std::vector<double> times;
    for (i64 i = 1; i <= samples; ++i) {
        u64 p = random_prime_bits(rng, (unsigned)bits);
        u64 q = random_prime_bits(rng, (unsigned)bits);
        u64 n = p * q;
        auto t0 = now_tp();
        std::vector<u64> fac = factorize_pollard_rho(n, ctx.seed);
        double ms = ms_since(t0);
        if (fac.size() != 2) {
            throw std::runtime_error(fmt::format("e043: bad factorization of {} = {} * {}", n, p, q));
        }
        csv.row(i, n, std::min(p, q), std::max(p, q), ms);
        times.push_back(ms);
    }

    ReportBuilder report(ctx.id, "Pollard rho runtime variability", ctx.reproduce);
    report.section("Parameters").param("samples", std::to_string(samples)).param("bits", std::to_string(bits));
    if (!times.empty()) {
        std::vector<double> sorted = times;
        std::sort(sorted.begin(), sorted.end());
        report.section("Timing (ms)")
            .param("min", fmt::format("{:.3f}", sorted.front()))
            .param("median", fmt::format("{:.3f}", sorted[sorted.size() / 2]))
            .param("max", fmt::format("{:.3f}", sorted.back()))
            .param("max / min", fmt::format("{:.1f}", sorted.back() / std::max(sorted.front(), 1e-6)));
    }
    report.section("Notes")
        .bullet("Factoring difficulty depends on structure (e.g., closeness of factors), not just bit size.")
        .bullet("Rho is stochastic; variance is expected and is a useful experimental feature.")
        .write(ctx.paths.report_path);
}

} // namespace Experiments
} // namespace PrimeLab
