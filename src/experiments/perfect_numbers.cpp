#include "experiments.hpp"
#include "bigint_utils.hpp"
#include "divisors.hpp"
#include "logger.hpp"
#include "mersenne.hpp"
#include "prime_statistics.hpp"
#include "primes.hpp"
#include "timing.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <fmt/format.h>

namespace PrimeLab {
namespace Experiments {

void run_e002(ExperimentContext &ctx) {
    const auto exponents = ctx.config.get<std::vector<i64>>("exponents", {2, 3, 5, 7, 13, 17, 19, 31});
    for (i64 p : exponents) require_at_least("exponents", p, 2);

    LOG_INFO("Computing even perfect numbers for {} exponents", exponents.size());
    CsvWriter csv(ctx.data("even_perfect_growth.csv"), {"p", "N", "digits", "bits", "log10_error"});
    std::vector<std::vector<std::string>> rows;
    const double log10_2 = std::log10(2.0);
    for (i64 p : exponents) {
        cpp_int N = even_perfect_from_exponent((unsigned)p);
        size_t digits = decimal_digits(N);
        size_t bits = bitlen(N);
        // log10 N = (2p - 1) log10 2 + log10(1 - 2^-p)
        double log10_n = (2.0 * p - 1.0) * log10_2 + std::log10(1.0 - std::pow(2.0, -(double)p));
        double err = log10_n - 2.0 * p * log10_2;
        csv.row(p, N, digits, bits, err);
        rows.push_back({std::to_string(p), std::to_string(digits), std::to_string(bits), fmt::format("{:.6f}", err)});
    }

    ReportBuilder report(ctx.id, "Even perfect numbers: generator and growth", ctx.reproduce);
    report.line(fmt::format("**Seed:** `{}`", ctx.seed))
        .section("Exponents")
        .line()
        .line("Mersenne prime exponents used in this run:")
        .line()
        .line(fmt::format("`{}`", fmt::join(exponents, ", ")))
        .table({"p", "digits(N)", "bits(N)", "log10 N - 2p log10 2"}, rows, "rrrr")
        .outputs({"data/even_perfect_growth.csv", "params.json"})
        .section("Notes")
        .bullet("Growth is extreme: both digits and bit length scale roughly linearly in `p`.")
        .bullet("The log-approximation error stays bounded and illustrates why `N(p)` behaves like "
                "`2^(2p)` up to a small correction.")
        .write(ctx.paths.report_path);
}

void run_e003(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 300000);
    const i64 stride = ctx.config.get<i64>("stride", 10);
    const int bins = ctx.config.get<int>("bins", 250);
    const double near_band = ctx.config.get<double>("near_band", 0.02);
    if (n_max < 1 || stride < 1) {
        throw std::invalid_argument("e003: n_max and stride must be positive");
    }

    LOG_INFO("Computing sigma sieve up to N={}", n_max);
    const std::vector<i64> sigma = sigma_sieve(n_max);

    std::vector<double> abund(n_max);
    std::vector<i64> perfect;
    for (i64 n = 1; n <= n_max; ++n) {
        abund[n - 1] = abundancy_index(sigma[n], n);
        if (is_perfect(sigma[n], n)) perfect.push_back(n);
    }
    LOG_INFO("Perfect numbers found up to N={}: {}", n_max, perfect.size());

    const Histogram h = histogram(abund, bins);
    CsvWriter hist_csv(ctx.data("abundancy_histogram.csv"), {"bin_lo", "bin_hi", "count"});
    for (int b = 0; b < bins; ++b) hist_csv.row(h.edges[b], h.edges[b + 1], h.counts[b]);

    CsvWriter scatter(ctx.data("abundancy_scatter.csv"), {"n", "abundancy"});
    for (i64 n = 1; n <= n_max; n += stride) scatter.row(n, abund[n - 1]);

    // Near-2 band, downsampled with the same stride
    CsvWriter near(ctx.data("abundancy_near_2.csv"), {"n", "abundancy"});
    i64 near_count = 0;
    for (i64 n = 1; n <= n_max; ++n) {
        if (std::fabs(abund[n - 1] - 2.0) >= near_band) continue;
        if (near_count++ % stride == 0) near.row(n, abund[n - 1]);
    }

    ReportBuilder report(ctx.id, "Abundancy index landscape", ctx.reproduce);
    report.section("Parameters")
        .param("N", std::to_string(n_max))
        .param("scatter stride", std::to_string(stride))
        .param("histogram bins", std::to_string(bins))
        .param("near band", fmt::format("{:g}", near_band))
        .outputs({"data/abundancy_histogram.csv", "data/abundancy_scatter.csv", "data/abundancy_near_2.csv",
                  "params.json"})
        .section("Findings")
        .param("Perfect numbers found (≤ N)", std::to_string(perfect.size()))
        .param("Perfect numbers", format_list(perfect))
        .param("n with |I(n) - 2| < near band", std::to_string(near_count))
        .section("Notes")
        .bullet("Compare perfection using integers: σ(n) == 2n.")
        .bullet("For plotting, floats are acceptable, but classification should not depend on float rounding.")
        .write(ctx.paths.report_path);
}

void run_e004(ExperimentContext &ctx) {
    const auto n_values = ctx.config.get<std::vector<i64>>("n_values", {10000, 30000, 60000, 100000});
    const int trials = ctx.config.get<int>("trials", 3);
    const i64 max_n_factor = ctx.config.get<i64>("max_n_factor", 100000);
    if (n_values.empty()) {
        throw std::invalid_argument("e004: n_values must not be empty");
    }

    i64 n_top = *std::max_element(n_values.begin(), n_values.end());
    i64 root = (i64)std::sqrt((double)n_top) + 1;
    const std::vector<i64> primes = primes_up_to(root);

    CsvWriter csv(ctx.data("sigma_benchmark.csv"), {"N", "sieve_s", "factorization_s"});
    std::vector<std::vector<std::string>> rows;
    for (i64 N : n_values) {
        LOG_INFO("Benchmarking N={}", N);
        double t_sieve = median_time_ms(trials, [N] { (void)sigma_sieve(N); }) / 1000.0;
        if (N > max_n_factor) {
            csv.row(N, t_sieve, std::string("nan"));
            rows.push_back({std::to_string(N), fmt::format("{:.4f}", t_sieve), "skipped", "n/a"});
            continue;
        }
        u64 checksum = 0;
        double t_fact = median_time_ms(trials, [&] {
            checksum = 0;
            for (i64 n = 1; n <= N; ++n) checksum += sigma_from_factorization((u64)n, primes);
        }) / 1000.0;
        LOG_DEBUG("N={} checksum={}", N, checksum);
        csv.row(N, t_sieve, t_fact);
        std::string speed = t_fact > 0 ? fmt::format("{:.2f}", t_sieve / t_fact) : "nan";
        rows.push_back({std::to_string(N), fmt::format("{:.4f}", t_sieve), fmt::format("{:.4f}", t_fact), speed});
    }

    ReportBuilder report(ctx.id, "Benchmark σ(n) computation: sieve vs factorization", ctx.reproduce);
    report.section("Parameters")
        .param("n_values", format_list(n_values))
        .param("trials", std::to_string(trials))
        .param("max_n_factor", std::to_string(max_n_factor))
        .section("Results (median runtime)")
        .table({"N", "sieve [s]", "factorization [s]", "speedup (sieve/fact)"}, rows, "rrrr")
        .section("Notes")
        .bullet("Sieve computes all σ(1..N) at once; factorization recomputes structure per number.")
        .bullet("Factorization is capped at max_n_factor to keep runtime reasonable.")
        .write(ctx.paths.report_path);
}

void run_e005(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 300000);

    LOG_INFO("Building SPF sieve up to N={}", n_max);
    const std::vector<u32> spf = spf_sieve(n_max);

    std::vector<i64> candidates;
    for (i64 n = 3; n <= n_max; n += 2) candidates.push_back(n);

    std::vector<std::pair<std::string, i64>> stages;
    stages.emplace_back("odd integers", (i64)candidates.size());

    std::vector<i64> touchard;
    for (i64 n : candidates) {
        if (touchard_congruence(n)) touchard.push_back(n);
    }
    stages.emplace_back("Touchard congruence", (i64)touchard.size());
    LOG_INFO("After Touchard congruence: {}", touchard.size());

    std::vector<i64> euler;
    for (i64 n : touchard) {
        if (euler_form_possible((u64)n, spf)) euler.push_back(n);
    }
    stages.emplace_back("Euler form", (i64)euler.size());
    LOG_INFO("After Euler form: {}", euler.size());

    CsvWriter csv(ctx.data("odd_perfect_survival.csv"), {"stage", "remaining"});
    std::vector<std::vector<std::string>> rows;
    for (const auto &[stage, count] : stages) {
        csv.row(stage, count);
        rows.push_back({stage, std::to_string(count)});
    }

    ReportBuilder report(ctx.id, "Odd perfect numbers: constraint filter pipeline", ctx.reproduce);
    report.section("Parameters")
        .param("N", std::to_string(n_max))
        .section("Survival table")
        .table({"Stage", "Remaining"}, rows, "lr")
        .section("Notes")
        .bullet("These are necessary conditions only; surviving candidates are *not* perfect by implication.")
        .bullet("Euler-form testing requires factorization; SPF makes it feasible for moderate N.")
        .write(ctx.paths.report_path);
}

void run_e006(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 300000);
    const i64 top_k = ctx.config.get<i64>("top_k", 50);
    const i64 stride = ctx.config.get<i64>("stride", 10);
    if (top_k < 1 || stride < 1) {
        throw std::invalid_argument("e006: top_k and stride must be positive");
    }

    LOG_INFO("Computing sigma sieve up to N={}", n_max);
    const std::vector<i64> sigma = sigma_sieve(n_max);
    const std::vector<NearMiss> top = near_misses(sigma, (size_t)top_k);

    CsvWriter scatter(ctx.data("near_miss_scatter.csv"), {"n", "rel_deviation"});
    for (i64 n = 1; n <= n_max; n += stride) {
        scatter.row(n, std::fabs(abundancy_index(sigma[n], n) - 2.0));
    }

    CsvWriter csv(ctx.data("near_miss_topk.csv"), {"rank", "n", "sigma", "abs_deviation", "rel_deviation"});
    std::vector<std::vector<std::string>> rows;
    for (size_t i = 0; i < top.size(); ++i) {
        const NearMiss &m = top[i];
        csv.row(i + 1, m.n, m.sigma, m.abs_deviation, m.rel_deviation);
        rows.push_back({std::to_string(i + 1), std::to_string(m.n), std::to_string(m.sigma),
                        std::to_string(m.abs_deviation), fmt::format("{:.3e}", m.rel_deviation)});
    }

    ReportBuilder report(ctx.id, "Near misses to perfection: σ(n) close to 2n", ctx.reproduce);
    report.section("Parameters")
        .param("N", std::to_string(n_max))
        .param("top_k", std::to_string(top_k))
        .param("scatter stride", std::to_string(stride))
        .section("Top near misses (excluding perfect numbers)")
        .table({"rank", "n", "σ(n)", "|σ(n) - 2n|", "|σ(n)/n - 2|"}, rows, "rrrrr")
        .section("Notes")
        .bullet("Deviation |σ(n) - 2n| = 1 occurs at powers of two (almost perfect numbers).")
        .bullet("Ranking uses exact integer deviations; the relative column is for comparison only.")
        .write(ctx.paths.report_path);
}

void run_e010(ExperimentContext &ctx) {
    const i64 p_max = ctx.config.get<i64>("p_max", 20000);
    const i64 max_tests = ctx.config.get<i64>("max_tests", 800);

    std::vector<i64> exps = primes_up_to(p_max);
    if ((i64)exps.size() > max_tests) exps.resize(max_tests);
    LOG_INFO("Running Lucas–Lehmer on {} prime exponents", exps.size());

    CsvWriter csv(ctx.data("lucas_lehmer_perfect.csv"), {"p", "is_mersenne_prime", "time_ms"});
    CsvWriter perf(ctx.data("perfect_digits.csv"), {"index", "p", "digits"});
    std::vector<std::vector<std::string>> rows;
    const double log10_2 = std::log10(2.0);
    for (i64 p : exps) {
        auto t0 = now_tp();
        bool prime = lucas_lehmer_is_prime((unsigned)p);
        double ms = ms_since(t0);
        csv.row(p, prime ? 1 : 0, ms);
        if (!prime) continue;
        i64 digits = (i64)std::floor((2.0 * p - 1.0) * log10_2) + 1;
        perf.row(rows.size() + 1, p, digits);
        rows.push_back({std::to_string(rows.size() + 1), std::to_string(p),
                        std::to_string(mersenne_digits(p)), std::to_string(digits)});
        LOG_DEBUG("M_{} is prime; perfect number has {} digits", p, digits);
    }

    ReportBuilder report(ctx.id, "Perfect numbers from Mersenne primes", ctx.reproduce);
    report.section("Parameters")
        .param("p_max", std::to_string(p_max))
        .param("max_tests", std::to_string(max_tests))
        .param("tested exponents", std::to_string(exps.size()))
        .section("Even perfect numbers found")
        .table({"#", "p", "digits(M_p)", "digits(N)"}, rows, "rrrr")
        .section("Notes")
        .bullet("Each Mersenne prime M_p gives the even perfect number N = 2^(p-1)(2^p - 1) (Euclid–Euler).")
        .bullet("Digits follow from logs: digits(N) = floor((2p - 1) log10 2) + 1.")
        .write(ctx.paths.report_path);
}

} // namespace Experiments
} // namespace PrimeLab
