#include "experiments.hpp"
#include "logger.hpp"
#include "prime_statistics.hpp"
#include "primes.hpp"
#include "timing.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <numeric>
#include <stdexcept>

namespace PrimeLab {
namespace Experiments {

static void require_positive(const char *id, const char *name, i64 v) {
    if (v < 1) throw std::invalid_argument(fmt::format("{}: {} must be >= 1", id, name));
}

static std::vector<i64> reduced_residues(i64 q) {
    std::vector<i64> out;
    for (i64 r = 0; r < q; ++r) {
        if (std::gcd(r, q) == 1) out.push_back(r);
    }
    return out;
}

void run_e017(ExperimentContext &ctx) {
    const auto n_values = ctx.config.get<std::vector<i64>>(
        "n_values", {1000000, 5000000, 10000000, 50000000, 100000000});
    const i64 segment_size = ctx.config.get<i64>("segment_size", 2000000);
    require_positive("e017", "segment_size", segment_size);
    if (n_values.empty()) {
        throw std::invalid_argument("e017: n_values must not be empty");
    }

    // one byte per sieve entry
    const double mib = 1024.0 * 1024.0;
    CsvWriter csv(ctx.data("sieve_memory.csv"), {"n", "full_sieve_mb", "segment_mb"});
    std::vector<std::vector<std::string>> rows;
    for (i64 n : n_values) {
        require_positive("e017", "n_values", n);
        double full = (double)n / mib;
        double seg = (double)std::min(n, segment_size) / mib;
        csv.row(n, full, seg);
        rows.push_back({std::to_string(n), fmt::format("{:.2f}", full), fmt::format("{:.2f}", seg)});
    }

    const i64 n_check = *std::min_element(n_values.begin(), n_values.end());
    auto t0 = now_tp();
    const i64 full_count = (i64)primes_up_to(n_check).size();
    double t_full = ms_since(t0);
    t0 = now_tp();
    const i64 seg_count = count_primes_segmented(n_check, segment_size);
    double t_seg = ms_since(t0);
    if (full_count != seg_count) {
        LOG_ERROR("Segmented sieve counted {} primes up to {}, full sieve {}", seg_count, n_check, full_count);
    }

    ReportBuilder report(ctx.id, "Sieve memory blow-up vs segmented sieve", ctx.reproduce);
    report.section("Parameters")
        .param("n_values", format_list(n_values))
        .param("segment_size", std::to_string(segment_size))
        .section("Memory estimate (1 byte per entry)")
        .table({"N", "full sieve [MB]", "segmented window [MB]"}, rows, "rrr")
        .section("Cross-check")
        .param("N", std::to_string(n_check))
        .param("pi(N) full sieve", fmt::format("{} ({:.1f} ms)", full_count, t_full))
        .param("pi(N) segmented sieve", fmt::format("{} ({:.1f} ms)", seg_count, t_seg))
        .param("agree", full_count == seg_count ? "yes" : "NO")
        .section("Notes")
        .bullet("A full sieve uses O(N) memory and can become the limiting factor.")
        .bullet("A segmented sieve keeps memory roughly constant by processing windows [L, R].")
        .write(ctx.paths.report_path);
}

void run_e019(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 2000000);
    const i64 stride = ctx.config.get<i64>("stride", 1000);
    require_positive("e019", "stride", stride);
    if (n_max < 2) throw std::invalid_argument("e019: n_max must be >= 2");

    const std::vector<i64> pi = pi_array_from_mask(prime_mask_up_to(n_max));
    CsvWriter csv(ctx.data("pi_vs_x_logx.csv"), {"x", "pi", "x_over_log_x", "error"});
    for (i64 x = 2; x <= n_max; x += stride) {
        double approx = (double)x / std::log((double)x);
        csv.row(x, pi[x], approx, (double)pi[x] - approx);
    }

    std::vector<std::vector<std::string>> rows;
    for (i64 x = 10; x <= n_max; x *= 10) {
        double approx = (double)x / std::log((double)x);
        rows.push_back({std::to_string(x), std::to_string(pi[x]), fmt::format("{:.1f}", approx),
                        fmt::format("{:.4f}", (double)pi[x] / approx)});
    }

    ReportBuilder report(ctx.id, "Prime density and PNT visualization", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("stride", std::to_string(stride))
        .section("Powers of ten")
        .table({"x", "pi(x)", "x/log x", "ratio"}, rows, "rrrr")
        .section("Notes")
        .bullet("The Prime Number Theorem suggests pi(x) ~ x/log x.")
        .bullet("The error curve shows the approximation improves overall but wiggles persist.")
        .write(ctx.paths.report_path);
}

void run_e020(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 3000000);
    const i64 step = ctx.config.get<i64>("step", 2000);

    const std::vector<i64> pi = pi_array_from_mask(prime_mask_up_to(n_max));
    const std::vector<LiPoint> li = li_trapezoid(n_max, step);

    CsvWriter csv(ctx.data("pi_vs_li.csv"), {"x", "pi", "x_over_log_x", "li", "err_x_logx", "err_li"});
    i64 li_closer = 0;
    for (const auto &pt : li) {
        i64 xi = (i64)pt.x;
        double xlogx = pt.x / std::log(pt.x);
        double e1 = (double)pi[xi] - xlogx;
        double e2 = (double)pi[xi] - pt.li;
        if (std::abs(e2) < std::abs(e1)) ++li_closer;
        csv.row(xi, pi[xi], xlogx, pt.li, e1, e2);
    }

    ReportBuilder report(ctx.id, "Compare pi(x) to li(x) numerically", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("step", std::to_string(step))
        .section("Summary")
        .param("grid points", std::to_string(li.size()))
        .param("points where li(x) is closer", std::to_string(li_closer))
        .section("Notes")
        .bullet("li(x) is defined by an integral of 1/log t and often tracks pi(x) more closely than x/log x.")
        .bullet("Here we use a coarse trapezoidal approximation (good enough for a visual experiment).")
        .write(ctx.paths.report_path);
}

void run_e021(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 2000000);
    const i64 stride = ctx.config.get<i64>("stride", 1000);
    const double c = ctx.config.get<double>("constant", 1.25506);
    require_positive("e021", "stride", stride);

    const std::vector<i64> pi = pi_array_from_mask(prime_mask_up_to(n_max));
    CsvWriter csv(ctx.data("explicit_bound.csv"), {"x", "pi", "x_over_log_x", "upper_bound"});
    std::vector<i64> below_lower, above_upper;
    for (i64 x = 17; x <= n_max; x += stride) {
        double xlogx = (double)x / std::log((double)x);
        double upper = c * xlogx;
        csv.row(x, pi[x], xlogx, upper);
        if ((double)pi[x] > upper) above_upper.push_back(x);
        if ((double)pi[x] < xlogx) below_lower.push_back(x);
    }
    if (!above_upper.empty()) {
        LOG_WARN("Upper bound {}·x/log x violated at {} grid points", c, above_upper.size());
    }

    auto first = [](const std::vector<i64> &v) {
        if (v.empty()) return std::string("_none_");
        std::vector<i64> head(v.begin(), v.begin() + std::min<size_t>(10, v.size()));
        return format_list(head);
    };

    ReportBuilder report(ctx.id, "Explicit bounds sanity checks", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("stride", std::to_string(stride))
        .param("constant", fmt::format("{}", c))
        .section("Violations on the grid (x >= 17)")
        .param("pi(x) < x/log x", std::to_string(below_lower.size()))
        .line("- first: " + first(below_lower))
        .param(fmt::format("pi(x) > {}·x/log x", c), std::to_string(above_upper.size()))
        .line("- first: " + first(above_upper))
        .section("Notes")
        .bullet("Many explicit inequalities for pi(x) have *starting points* (valid only for x ≥ x0).")
        .bullet("Experiments should always verify the assumptions before using a bound as a 'test oracle'.")
        .write(ctx.paths.report_path);
}

void run_e022(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 5000000);
    const i64 stride = ctx.config.get<i64>("stride", 100);
    require_positive("e022", "stride", stride);

    const std::vector<i64> primes = primes_up_to(n_max);
    CsvWriter csv(ctx.data("prime_race_mod4.csv"), {"p", "count_1_mod_4", "count_3_mod_4", "difference"});
    i64 a = 0, b = 0, leads_3 = 0, k = 0;
    i64 last_lead_1 = -1;
    for (i64 p : primes) {
        if (p < 3) continue;
        (p % 4 == 1 ? a : b) += 1;
        if (b > a) {
            ++leads_3;
        } else if (a > b) {
            last_lead_1 = p;
        }
        if (k++ % stride == 0) csv.row(p, a, b, a - b);
    }

    ReportBuilder report(ctx.id, "Prime race modulo 4", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Summary")
        .param("pi(x;4,1)", std::to_string(a))
        .param("pi(x;4,3)", std::to_string(b))
        .param("primes where the 3 mod 4 class leads", std::to_string(leads_3))
        .param("largest prime where the 1 mod 4 class leads",
               last_lead_1 < 0 ? std::string("none") : std::to_string(last_lead_1))
        .section("Notes")
        .bullet("Dirichlet's theorem implies each residue class (1 and 3 mod 4) gets infinitely many primes.")
        .bullet("Yet finite ranges show biases (the 'prime race' phenomenon).")
        .write(ctx.paths.report_path);
}

// Cumulative counts per reduced residue class, sampled every `stride` primes
static std::vector<i64> residue_counts(ExperimentContext &ctx, const std::string &file, i64 n_max, i64 q,
                                       i64 p_min, i64 stride) {
    const std::vector<i64> residues = reduced_residues(q);
    std::vector<std::string> header = {"p"};
    for (i64 r : residues) header.push_back("r" + std::to_string(r));
    CsvWriter csv(ctx.data(file), header);

    std::vector<i64> counts(q, 0);
    i64 k = 0;
    std::vector<std::string> row;
    const std::vector<i64> primes = primes_up_to(n_max);
    for (size_t i = 0; i < primes.size(); ++i) {
        i64 p = primes[i];
        if (p < p_min) continue;
        counts[p % q] += 1;
        bool last = i + 1 == primes.size();
        if (k++ % stride != 0 && !last) continue;
        row = {std::to_string(p)};
        for (i64 r : residues) row.push_back(std::to_string(counts[r]));
        csv.row_cells(row);
    }
    return counts;
}

static std::vector<std::vector<std::string>> residue_table(const std::vector<i64> &counts, i64 q) {
    const std::vector<i64> residues = reduced_residues(q);
    i64 total = 0;
    for (i64 r : residues) total += counts[r];
    std::vector<std::vector<std::string>> rows;
    for (i64 r : residues) {
        double share = total > 0 ? (double)counts[r] / (double)total : 0.0;
        double expected = 1.0 / (double)residues.size();
        rows.push_back({std::to_string(r), std::to_string(counts[r]), fmt::format("{:.5f}", share),
                        fmt::format("{:+.5f}", share - expected)});
    }
    return rows;
}

void run_e023(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 3000000);
    const i64 q = ctx.config.get<i64>("q", 10);
    const i64 stride = ctx.config.get<i64>("stride", 100);
    if (q < 2) throw std::invalid_argument("e023: q must be >= 2");
    require_positive("e023", "stride", stride);

    const std::vector<i64> counts = residue_counts(ctx, "residue_class_counts.csv", n_max, q, 3, stride);

    ReportBuilder report(ctx.id, fmt::format("Residue class distribution mod {}", q), ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("q", std::to_string(q))
        .section("Final counts (primes >= 3)")
        .table({"r", "count", "share", "share - 1/phi(q)"}, residue_table(counts, q), "rrrr")
        .section("Notes")
        .bullet("In the limit, reduced residue classes should balance, but finite ranges can show visible drift.")
        .write(ctx.paths.report_path);
}

void run_e024(ExperimentContext &ctx) {
    const i64 size = ctx.config.get<i64>("size", 301);
    if (size < 1 || size % 2 == 0) {
        throw std::invalid_argument("e024: size must be a positive odd integer");
    }

    const auto grid = ulam_spiral((int)size);
    const std::vector<char> mask = prime_mask_up_to(size * size);

    std::vector<std::string> header;
    for (i64 x = 0; x < size; ++x) header.push_back("c" + std::to_string(x));
    CsvWriter csv(ctx.data("ulam_spiral.csv"), header);

    i64 primes_on_diagonals = 0, primes_total = 0, diagonal_cells = 0;
    const i64 mid = size / 2;
    std::vector<std::string> row;
    for (i64 y = 0; y < size; ++y) {
        row.clear();
        for (i64 x = 0; x < size; ++x) {
            bool prime = mask[grid[y][x]] != 0;
            row.push_back(prime ? "1" : "0");
            bool diagonal = std::abs(x - mid) == std::abs(y - mid);
            diagonal_cells += diagonal;
            primes_total += prime;
            if (prime && diagonal) ++primes_on_diagonals;
        }
        csv.row_cells(row);
    }

    const double cells = (double)(size * size);
    ReportBuilder report(ctx.id, "Ulam spiral structure", ctx.reproduce);
    report.section("Parameters")
        .param("size", std::to_string(size))
        .section("Summary")
        .param("primes in grid", std::to_string(primes_total))
        .param("prime density (whole grid)", fmt::format("{:.4f}", primes_total / cells))
        .param("prime density (main diagonals)", fmt::format("{:.4f}", primes_on_diagonals / (double)diagonal_cells))
        .section("Notes")
        .bullet("Diagonal streaks correspond to quadratic polynomials that produce many primes for small n.")
        .bullet("This is a visual 'pattern trap': structure is real, but it does not imply a simple rule for primes.")
        .outputs({"data/ulam_spiral.csv (1 = prime)", "params.json", "report.md"})
        .write(ctx.paths.report_path);
}

void run_e035(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const i64 q = ctx.config.get<i64>("q", 12);
    const i64 stride = ctx.config.get<i64>("stride", 1000);
    if (q < 2) throw std::invalid_argument("e035: q must be >= 2");
    require_positive("e035", "stride", stride);

    const std::vector<i64> counts = residue_counts(ctx, "primes_in_ap_counts.csv", n_max, q, 5, stride);
    LOG_DEBUG("Counted primes in {} reduced residue classes mod {}", reduced_residues(q).size(), q);

    ReportBuilder report(ctx.id, fmt::format("Primes in arithmetic progressions mod {}", q), ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("q", std::to_string(q))
        .section("Final counts (primes >= 5)")
        .table({"r", "count", "share", "share - 1/phi(q)"}, residue_table(counts, q), "rrrr")
        .section("Notes")
        .bullet("Dirichlet's theorem guarantees infinitely many primes in each reduced residue class.")
        .bullet("Finite ranges show biases and slow convergence to equal proportions.")
        .write(ctx.paths.report_path);
}

void run_e038(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 500000);
    const i64 stride = ctx.config.get<i64>("stride", 1000);
    require_positive("e038", "stride", stride);
    if (n_max < 2) throw std::invalid_argument("e038: n_max must be >= 2");

    const std::vector<i64> pi = pi_array_from_mask(prime_mask_up_to(2 * n_max));
    CsvWriter csv(ctx.data("bertrand.csv"), {"n", "primes_in_n_2n"});
    std::vector<i64> failures;
    i64 min_count = -1;
    for (i64 n = 2; n <= n_max; ++n) {
        // primes strictly between n and 2n; 2n itself is never prime for n >= 2
        i64 count = pi[2 * n] - pi[n];
        if (count == 0) failures.push_back(n);
        if (min_count < 0 || count < min_count) min_count = count;
        if ((n - 2) % stride == 0) csv.row(n, count);
    }
    if (!failures.empty()) {
        LOG_ERROR("Bertrand check failed for {} values of n", failures.size());
    }

    ReportBuilder report(ctx.id, "Bertrand's postulate (computational verification)", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Results")
        .param("n checked", std::to_string(n_max - 1))
        .param("failures", std::to_string(failures.size()))
        .param("minimum number of primes in (n, 2n)", std::to_string(min_count))
        .section("Notes")
        .bullet("Bertrand's postulate is a theorem; this experiment is a quick computational sanity check.")
        .bullet("It's also a useful 'prime existence oracle' for constructing examples.")
        .write(ctx.paths.report_path);
}

} // namespace Experiments
} // namespace PrimeLab
