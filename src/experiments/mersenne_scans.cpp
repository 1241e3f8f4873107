#include "experiments.hpp"
#include "logger.hpp"
#include "mersenne.hpp"
#include "primes.hpp"
#include "timing.hpp"
#include <fmt/format.h>
#include <stdexcept>

namespace PrimeLab {
namespace Experiments {

// First max_tests primes <= p_max
static std::vector<i64> exponents_to_test(i64 p_max, i64 max_tests) {
    if (max_tests < 0) {
        throw std::invalid_argument("max_tests must be >= 0");
    }
    std::vector<i64> exps = primes_up_to(p_max);
    if ((i64)exps.size() > max_tests) exps.resize(max_tests);
    return exps;
}

static std::string join_or_none(const std::vector<i64> &v) {
    if (v.empty()) return "_none in this range (or max_tests too small)_";
    return fmt::format("{}", fmt::join(v, ", "));
}

void run_e007(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 500000);
    const i64 stride = ctx.config.get<i64>("stride", 50);
    if (n_max < 1 || stride < 1) {
        throw std::invalid_argument("e007: n_max and stride must be positive");
    }

    CsvWriter csv(ctx.data("mersenne_growth.csv"), {"n", "digits", "bits"});
    for (i64 n = 1; n <= n_max; n += stride) {
        // bit length of 2^n - 1 is exactly n
        csv.row(n, mersenne_digits(n), n);
    }
    LOG_DEBUG("Wrote {} growth samples", csv.rows());

    std::vector<std::vector<std::string>> rows;
    for (i64 n : {1, 2, 3, 5, 10, 100, 1000, 10000}) {
        rows.push_back({std::to_string(n), std::to_string(mersenne_digits(n)), std::to_string(n)});
    }

    ReportBuilder report(ctx.id, "Mersenne number growth", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("stride", std::to_string(stride))
        .section("Quick reference table")
        .table({"n", "digits(M_n)", "bits(M_n)"}, rows, "rrr")
        .section("Notes")
        .bullet("For n ≥ 1, the bit-length of M_n is exactly n.")
        .bullet("digits(M_n) can be computed via floor(n·log10(2)) + 1 without building M_n.")
        .write(ctx.paths.report_path);
}

void run_e008(ExperimentContext &ctx) {
    const i64 p_max = ctx.config.get<i64>("p_max", 10000);
    const i64 max_tests = ctx.config.get<i64>("max_tests", 600);

    const std::vector<i64> exps = exponents_to_test(p_max, max_tests);
    LOG_INFO("Lucas–Lehmer scan over {} exponents (p <= {})", exps.size(), p_max);

    CsvWriter csv(ctx.data("lucas_lehmer_scan.csv"), {"index", "p", "is_mersenne_prime", "time_ms", "cumulative_found"});
    std::vector<i64> found;
    for (size_t i = 0; i < exps.size(); ++i) {
        const i64 p = exps[i];
        auto t0 = now_tp();
        bool prime = lucas_lehmer_is_prime((unsigned)p);
        double ms = ms_since(t0);
        if (prime) {
            found.push_back(p);
            LOG_DEBUG("M_{} is prime", p);
        }
        csv.row(i + 1, p, prime ? 1 : 0, ms, found.size());
    }

    ReportBuilder report(ctx.id, "Lucas–Lehmer scan for Mersenne primes", ctx.reproduce);
    report.section("Parameters")
        .param("p_max", std::to_string(p_max))
        .param("max_tests", std::to_string(max_tests))
        .section("Results")
        .param("tested exponents", std::to_string(exps.size()))
        .param("Mersenne primes found", std::to_string(found.size()))
        .line()
        .line("### Prime exponents p where M_p is prime")
        .line()
        .line(join_or_none(found))
        .section("Notes")
        .bullet("LLT is a deterministic primality test specialized to M_p = 2^p - 1.")
        .bullet("Only prime exponents p need to be tested: if 2^n-1 is prime, then n must be prime.")
        .write(ctx.paths.report_path);
}

void run_e009(ExperimentContext &ctx) {
    const i64 p_max = ctx.config.get<i64>("p_max", 10000);
    const i64 max_tests = ctx.config.get<i64>("max_tests", 800);
    const i64 q_max = ctx.config.get<i64>("q_max", 5000000);
    const bool require_q_prime = ctx.config.get<bool>("require_q_prime", true);
    require_at_least("q_max", q_max, 0);

    const std::vector<i64> exps = exponents_to_test(p_max, max_tests);
    std::vector<char> mask;
    if (require_q_prime) mask = prime_mask_up_to(q_max);

    CsvWriter csv(ctx.data("small_factor_scan.csv"), {"index", "p", "factor_q", "fraction_with_factor"});
    std::vector<std::vector<std::string>> rows;
    i64 found = 0;
    for (size_t i = 0; i < exps.size(); ++i) {
        const i64 p = exps[i];
        auto q = find_small_factor_for_mersenne((unsigned)p, (u64)q_max, require_q_prime ? &mask : nullptr);
        if (q) {
            ++found;
            if (rows.size() < 25) rows.push_back({std::to_string(p), std::to_string(*q)});
        }
        csv.row(i + 1, p, q ? std::to_string(*q) : std::string(""), (double)found / (double)(i + 1));
    }
    if (found == 0) {
        LOG_INFO("No factors found under q_max={}", q_max);
    }

    ReportBuilder report(ctx.id, "Small-factor scan for Mersenne numbers", ctx.reproduce);
    report.section("Parameters")
        .param("p_max", std::to_string(p_max))
        .param("max_tests", std::to_string(max_tests))
        .param("q_max", std::to_string(q_max))
        .param("require_q_prime", require_q_prime ? "true" : "false")
        .section("Results")
        .param("tested exponents", std::to_string(exps.size()))
        .param("exponents with a factor q ≤ q_max", std::to_string(found))
        .param("fraction", exps.empty() ? std::string("n/a") : fmt::format("{:.4f}", (double)found / exps.size()));
    if (!rows.empty()) {
        report.section("First factors found").table({"p", "q"}, rows, "rr");
    }
    report.section("Notes")
        .bullet("Any prime factor q of M_p (p odd prime) satisfies q ≡ 1 (mod 2p) and q ≡ ±1 (mod 8).")
        .bullet("A cheap scan over q = 2kp + 1 eliminates many exponents before running Lucas–Lehmer.")
        .write(ctx.paths.report_path);
}

void run_e011(ExperimentContext &ctx) {
    const i64 p_max = ctx.config.get<i64>("p_max", 20000);
    const i64 max_tests = ctx.config.get<i64>("max_tests", 900);

    const std::vector<i64> exps = exponents_to_test(p_max, max_tests);
    CsvWriter csv(ctx.data("observed_vs_expected.csv"), {"p", "observed", "expected"});
    std::vector<i64> found;
    double expected = 0.0;
    for (i64 p : exps) {
        if (lucas_lehmer_is_prime((unsigned)p)) found.push_back(p);
        expected += mersenne_prime_expectation((unsigned)p);
        csv.row(p, found.size(), expected);
    }
    const i64 last_p = exps.empty() ? 0 : exps.back();
    LOG_INFO("Observed {} Mersenne primes, heuristic expects {:.3f}", found.size(), expected);

    ReportBuilder report(ctx.id, "Heuristic vs observed counts of Mersenne primes", ctx.reproduce);
    report.section("Parameters")
        .param("p_max", std::to_string(p_max))
        .param("max_tests", std::to_string(max_tests))
        .section("Summary")
        .param("largest tested p", std::to_string(last_p))
        .param("observed count", std::to_string(found.size()))
        .param("expected (heuristic)", fmt::format("{:.6g}", expected))
        .section("Found Mersenne prime exponents")
        .line()
        .line(join_or_none(found))
        .section("Notes")
        .bullet("The heuristic probability is ~ 1/(p·ln 2) for prime p.")
        .bullet("This is not a theorem; it is a back-of-the-envelope model for rarity.")
        .write(ctx.paths.report_path);
}

} // namespace Experiments
} // namespace PrimeLab
