#include "experiments.hpp"
#include "logger.hpp"
#include "prime_statistics.hpp"
#include "primes.hpp"
#include "special_forms.hpp"
#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <map>
#include <stdexcept>

namespace PrimeLab {
namespace Experiments {

// starts[x] = #{p <= x : p and p + offsets[i] all prime}, for x + max(offset) inside the mask
static std::vector<i64> pattern_prefix(const std::vector<char> &mask, const std::vector<i64> &offsets) {
    const i64 reach = *std::max_element(offsets.begin(), offsets.end());
    const i64 n = (i64)mask.size() - 1 - reach;
    std::vector<i64> starts(std::max<i64>(n + 1, 0), 0);
    i64 count = 0;
    for (i64 p = 0; p <= n; ++p) {
        bool ok = mask[p] != 0;
        for (size_t i = 0; ok && i < offsets.size(); ++i) ok = mask[p + offsets[i]] != 0;
        count += ok;
        starts[p] = count;
    }
    return starts;
}

static std::vector<i64> grid(i64 first, i64 last, i64 step) {
    if (step < 1) throw std::invalid_argument("grid step must be >= 1");
    std::vector<i64> xs;
    for (i64 x = first; x <= last; x += step) xs.push_back(x);
    return xs;
}

static std::string pattern_label(const std::vector<i64> &offsets) {
    return fmt::format("{{{}}}", fmt::join(offsets, ","));
}

void run_e025(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 2000000);

    const std::vector<i64> primes = primes_up_to(n_max);
    const std::vector<i64> gaps = prime_gaps(primes);
    if (gaps.empty()) {
        throw std::invalid_argument("e025: n_max too small, need at least two primes");
    }

    CsvWriter csv(ctx.data("prime_gaps.csv"), {"index", "p", "gap"});
    std::map<i64, i64> first_seen;
    i64 decreases = 0, sum = 0;
    for (size_t i = 0; i < gaps.size(); ++i) {
        csv.row(i + 1, primes[i], gaps[i]);
        first_seen.emplace(gaps[i], primes[i]);
        if (i > 0 && gaps[i] < gaps[i - 1]) ++decreases;
        sum += gaps[i];
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto &[g, p] : first_seen) {
        if (g > 30) break;
        rows.push_back({std::to_string(g), std::to_string(p)});
    }

    ReportBuilder report(ctx.id, "Prime gaps are not monotone", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Summary")
        .param("gaps", std::to_string(gaps.size()))
        .param("maximum gap", std::to_string(*std::max_element(gaps.begin(), gaps.end())))
        .param("mean gap", fmt::format("{:.3f}", (double)sum / (double)gaps.size()))
        .param("log(n_max)", fmt::format("{:.3f}", std::log((double)n_max)))
        .param("times the gap shrinks from one prime to the next", std::to_string(decreases))
        .section("First occurrence of small gaps")
        .table({"gap", "first p"}, rows, "rr")
        .section("Notes")
        .bullet("Even though the *typical* gap near x is about log x, gaps fluctuate wildly.")
        .bullet("This series is a quick antidote to monotonic thinking.")
        .write(ctx.paths.report_path);
}

void run_e026(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 5000000);
    const i64 bins = ctx.config.get<i64>("bins", 60);

    const std::vector<i64> primes = primes_up_to(n_max);
    if (primes.size() < 3) {
        throw std::invalid_argument("e026: n_max too small");
    }
    // skip p = 2, where log p < 1 inflates the ratio
    std::vector<double> normalized;
    for (size_t i = 1; i + 1 < primes.size(); ++i) {
        normalized.push_back((double)(primes[i + 1] - primes[i]) / std::log((double)primes[i]));
    }
    const Histogram h = histogram(normalized, (int)bins);

    CsvWriter csv(ctx.data("normalized_gap_histogram.csv"), {"bin_left", "bin_right", "count"});
    for (size_t b = 0; b < h.counts.size(); ++b) csv.row(h.edges[b], h.edges[b + 1], h.counts[b]);

    double mean = 0.0;
    for (double v : normalized) mean += v;
    mean /= (double)normalized.size();
    const size_t mode_bin = std::max_element(h.counts.begin(), h.counts.end()) - h.counts.begin();

    ReportBuilder report(ctx.id, "Normalized prime gaps", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("bins", std::to_string(bins))
        .section("Summary")
        .param("samples", std::to_string(normalized.size()))
        .param("mean of g/log p", fmt::format("{:.4f}", mean))
        .param("fullest bin", fmt::format("[{:.3f}, {:.3f})", h.edges[mode_bin], h.edges[mode_bin + 1]))
        .section("Notes")
        .bullet("Normalization lets you compare gap statistics across different magnitudes of p.")
        .write(ctx.paths.report_path);
}

void run_e027(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 20000000);

    const std::vector<RecordGap> records = record_gaps(primes_up_to(n_max));
    CsvWriter csv(ctx.data("record_gaps.csv"), {"p", "gap", "log2_p", "ratio"});
    std::vector<std::vector<std::string>> rows;
    for (const auto &r : records) {
        double l = std::log((double)r.p);
        double heur = l * l;
        csv.row(r.p, r.gap, heur, (double)r.gap / heur);
        rows.push_back({std::to_string(r.p), std::to_string(r.gap), fmt::format("{:.2f}", heur),
                        fmt::format("{:.3f}", (double)r.gap / heur)});
    }
    LOG_INFO("{} record gaps below {}", records.size(), n_max);

    ReportBuilder report(ctx.id, "Record prime gaps vs log^2 heuristic", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Record gaps")
        .table({"p", "gap", "log(p)^2", "gap / log(p)^2"}, rows, "rrrr")
        .section("Notes")
        .bullet("Cramér-style heuristics suggest maximal gaps around x scale like O(log^2 x).")
        .bullet("This experiment is empirical: we compare record gaps to log^2(p) on a finite range.")
        .write(ctx.paths.report_path);
}

void run_e028(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const i64 window = ctx.config.get<i64>("window", 200000);
    const i64 step = ctx.config.get<i64>("step", 100000);
    if (window < 1 || step < 1) {
        throw std::invalid_argument("e028: window and step must be >= 1");
    }

    const std::vector<i64> primes = primes_up_to(n_max);
    const std::vector<i64> gaps = prime_gaps(primes);
    if (gaps.empty()) {
        throw std::invalid_argument("e028: n_max too small");
    }

    CsvWriter csv(ctx.data("jumping_champions.csv"), {"window_start", "window_end_prime", "champion"});
    std::map<i64, i64> champion_windows;
    const i64 last_start = std::max<i64>(1, (i64)gaps.size() - window);
    for (i64 start = 0; start < last_start; start += step) {
        i64 champ = jumping_champion(gaps, (size_t)start, (size_t)(start + window));
        size_t end_idx = std::min<size_t>((size_t)(start + window), primes.size() - 1);
        csv.row(start, primes[end_idx], champ);
        ++champion_windows[champ];
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto &[g, n] : champion_windows) rows.push_back({std::to_string(g), std::to_string(n)});

    ReportBuilder report(ctx.id, "Jumping champions (most frequent gaps)", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .line(fmt::format("- window: `{}` gaps", window))
        .line(fmt::format("- step: `{}` gaps", step))
        .section("Champions")
        .table({"gap", "windows won"}, rows, "rr")
        .section("Notes")
        .bullet("The most frequent gap tends to be a small primorial-related number (often 6 for quite a while).")
        .bullet("This is a fun example of 'typical behavior' that changes slowly with scale.")
        .write(ctx.paths.report_path);
}

void run_e029(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const i64 x_step = ctx.config.get<i64>("x_step", 200000);

    const std::vector<char> mask = prime_mask_up_to(n_max);
    const std::vector<i64> twins = pattern_prefix(mask, {0, 2});

    CsvWriter csv(ctx.data("twin_counts.csv"), {"x", "observed", "heuristic", "ratio"});
    std::vector<std::vector<std::string>> rows;
    for (i64 x : grid(100000, n_max, x_step)) {
        // both members of the pair must be <= x
        i64 observed = twins[x - 2];
        double l = std::log((double)x);
        double heur = 2.0 * TWIN_PRIME_CONSTANT * (double)x / (l * l);
        csv.row(x, observed, heur, (double)observed / heur);
        rows.push_back({std::to_string(x), std::to_string(observed), fmt::format("{:.1f}", heur),
                        fmt::format("{:.3f}", (double)observed / heur)});
    }
    if (rows.size() > 10) rows.erase(rows.begin() + 5, rows.end() - 5);

    ReportBuilder report(ctx.id, "Twin primes: observed vs heuristic", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("x_step", std::to_string(x_step))
        .section("Observed vs 2C2 x/log^2 x (first and last grid points)")
        .table({"x", "twin pairs", "heuristic", "ratio"}, rows, "rrrr")
        .section("Notes")
        .bullet("The heuristic curve is not a theorem; it's an asymptotic guess from prime k-tuple heuristics.")
        .bullet("The point is to compare shapes and scaling, not to expect perfect agreement at small x.")
        .write(ctx.paths.report_path);
}

void run_e030(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const auto d_values = ctx.config.get<std::vector<i64>>("d_values", {4, 6});
    const i64 x_step = ctx.config.get<i64>("x_step", 200000);
    if (d_values.empty()) {
        throw std::invalid_argument("e030: d_values must not be empty");
    }

    const std::vector<char> mask = prime_mask_up_to(n_max);
    std::vector<std::vector<i64>> prefixes;
    std::vector<std::string> header = {"x"};
    for (i64 d : d_values) {
        if (d < 1 || d >= n_max) throw std::invalid_argument("e030: d_values must be in [1, n_max)");
        prefixes.push_back(pattern_prefix(mask, {0, d}));
        header.push_back("pairs_d" + std::to_string(d));
    }

    CsvWriter csv(ctx.data("prime_pair_counts.csv"), header);
    std::vector<std::string> row;
    for (i64 x : grid(200000, n_max, x_step)) {
        row = {std::to_string(x)};
        for (size_t k = 0; k < d_values.size(); ++k) row.push_back(std::to_string(prefixes[k][x - d_values[k]]));
        csv.row_cells(row);
    }

    std::vector<std::vector<std::string>> rows;
    for (size_t k = 0; k < d_values.size(); ++k) {
        rows.push_back({std::to_string(d_values[k]), std::to_string(prefixes[k].back())});
    }

    ReportBuilder report(ctx.id, "Cousin and sexy prime pairs", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("d_values", format_list(d_values))
        .section("Pairs (p, p + d) with p + d <= n_max")
        .table({"d", "pairs"}, rows, "rr")
        .section("Notes")
        .bullet("Prime pairs with fixed even gap d are all instances of prime constellations.")
        .bullet("Different d values have different 'local obstructions' (mod constraints) and different constants.")
        .write(ctx.paths.report_path);
}

void run_e031(ExperimentContext &ctx) {
    const i64 max_mod = ctx.config.get<i64>("max_mod", 29);
    const std::vector<i64> small_primes = primes_up_to(max_mod);
    const std::vector<std::pair<std::string, std::vector<i64>>> patterns = {
        {"twin", {0, 2}},
        {"cousin", {0, 4}},
        {"sexy", {0, 6}},
        {"bad triple", {0, 2, 4}},
        {"prime triplet", {0, 2, 6}},
        {"prime quadruplet", {0, 2, 6, 8}},
    };

    CsvWriter csv(ctx.data("admissibility.csv"), {"pattern", "offsets", "admissible", "blocking_prime"});
    std::vector<std::string> results;
    for (const auto &[name, offsets] : patterns) {
        bool ok = is_admissible(offsets, small_primes);
        i64 blocker = 0;
        for (i64 p : small_primes) {
            if (!is_admissible(offsets, {p})) {
                blocker = p;
                break;
            }
        }
        csv.row(name, pattern_label(offsets), ok ? 1 : 0, blocker);
        std::string line = fmt::format("- {} {}: {}", name, pattern_label(offsets), ok ? "admissible" : "NOT admissible");
        if (!ok) line += fmt::format(" (covers every residue mod {})", blocker);
        results.push_back(line);
    }

    ReportBuilder report(ctx.id, "Admissibility and modular obstructions", ctx.reproduce);
    report.section("Parameters").param("max_mod", std::to_string(max_mod)).section("Results");
    for (const auto &l : results) report.line(l);
    report.section("Notes")
        .bullet("A pattern must be admissible (no modulus p blocks it completely) to have any chance of "
                "occurring infinitely often.")
        .bullet("This is a crisp 'counterexample filter' for naive prime-pattern claims.")
        .write(ctx.paths.report_path);
}

void run_e032(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const i64 x_step = ctx.config.get<i64>("x_step", 500000);
    const std::vector<std::pair<std::string, std::vector<i64>>> patterns = {
        {"triplet {0,2,6}", {0, 2, 6}},
        {"triplet {0,4,6}", {0, 4, 6}},
        {"quadruplet {0,2,6,8}", {0, 2, 6, 8}},
    };

    // pattern starts p <= n_max may reach up to n_max + 8
    const std::vector<char> mask = prime_mask_up_to(n_max + 8);
    std::vector<std::vector<i64>> prefixes;
    for (const auto &pt : patterns) prefixes.push_back(pattern_prefix(mask, pt.second));

    CsvWriter csv(ctx.data("constellation_counts.csv"), {"x", "triplet_0_2_6", "triplet_0_4_6", "quadruplet_0_2_6_8"});
    for (i64 x : grid(x_step, n_max, x_step)) {
        csv.row(x, prefixes[0][x], prefixes[1][x], prefixes[2][x]);
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto &[name, offsets] : patterns) {
        i64 total = count_pattern_occurrences(offsets, mask, n_max);
        i64 first = -1;
        for (i64 p = 2; p <= n_max && first < 0; ++p) {
            bool ok = true;
            for (i64 o : offsets) ok = ok && mask[p + o];
            if (ok) first = p;
        }
        rows.push_back({name, std::to_string(total), first < 0 ? "—" : std::to_string(first)});
    }

    ReportBuilder report(ctx.id, "Prime triplets and quadruplets", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .section("Counts (starting prime p <= n_max)")
        .table({"pattern", "count", "first p"}, rows, "lrr")
        .section("Notes")
        .bullet("These patterns are rare; counts grow slowly.")
        .bullet("The series helps compare how quickly different constellations appear in the same range.")
        .write(ctx.paths.report_path);
}

void run_e033(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const i64 threshold = ctx.config.get<i64>("threshold", 100);
    const i64 stride = ctx.config.get<i64>("stride", 1000);
    if (stride < 1) throw std::invalid_argument("e033: stride must be >= 1");

    const std::vector<i64> gaps = prime_gaps(primes_up_to(n_max));
    CsvWriter csv(ctx.data("bounded_vs_twins.csv"), {"gap_index", "gaps_le_threshold", "twin_gaps"});
    i64 small = 0, twins = 0;
    for (size_t i = 0; i < gaps.size(); ++i) {
        small += gaps[i] <= threshold;
        twins += gaps[i] == 2;
        if ((i + 1) % (size_t)stride == 0 || i + 1 == gaps.size()) csv.row(i + 1, small, twins);
    }

    ReportBuilder report(ctx.id, "Bounded gaps vs twin primes (not the same)", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("threshold", std::to_string(threshold))
        .section("Totals")
        .param("gaps", std::to_string(gaps.size()))
        .param(fmt::format("gaps <= {}", threshold), std::to_string(small))
        .param("twin gaps (== 2)", std::to_string(twins))
        .section("Notes")
        .bullet("Seeing many small gaps does not imply the smallest gap (2) occurs infinitely often.")
        .bullet("This is not a proof statement, just a numerical 'intuition guardrail'.")
        .write(ctx.paths.report_path);
}

void run_e034(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 10000000);
    const i64 window = ctx.config.get<i64>("window", 500000);
    const i64 step = ctx.config.get<i64>("step", 200000);
    if (window < 3 || step < 1 || window >= n_max) {
        throw std::invalid_argument("e034: need 3 <= window < n_max and step >= 1");
    }

    const std::vector<char> mask = prime_mask_up_to(n_max);
    const std::vector<i64> twins = pattern_prefix(mask, {0, 2});

    CsvWriter csv(ctx.data("twin_windows.csv"), {"window_start", "window_end", "twin_pairs"});
    std::vector<i64> counts;
    for (i64 lo = 2; lo < n_max - window; lo += step) {
        i64 hi = lo + window;
        // pairs (p, p+2) with lo <= p and p + 2 <= hi
        i64 c = twins[hi - 2] - twins[lo - 1];
        csv.row(lo, hi, c);
        counts.push_back(c);
    }
    if (counts.empty()) {
        throw std::invalid_argument("e034: no complete window fits below n_max");
    }

    double mean = 0.0, var = 0.0;
    for (i64 c : counts) mean += (double)c;
    mean /= (double)counts.size();
    for (i64 c : counts) var += ((double)c - mean) * ((double)c - mean);
    var /= (double)counts.size();
    auto [mn, mx] = std::minmax_element(counts.begin(), counts.end());

    ReportBuilder report(ctx.id, "Twin primes in sliding windows", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("window", std::to_string(window))
        .param("step", std::to_string(step))
        .section("Window statistics")
        .param("windows", std::to_string(counts.size()))
        .param("min / max", fmt::format("{} / {}", *mn, *mx))
        .param("mean", fmt::format("{:.2f}", mean))
        .param("std dev", fmt::format("{:.2f}", std::sqrt(var)))
        .section("Notes")
        .bullet("Even if a heuristic gives an average density, local counts in windows vary a lot.")
        .bullet("This is a counterexample to 'smoothness' assumptions when eyeballing primes.")
        .write(ctx.paths.report_path);
}

void run_e036(ExperimentContext &ctx) {
    const i64 n_max = ctx.config.get<i64>("n_max", 2000000);
    const i64 max_d = ctx.config.get<i64>("max_d", 5000);
    const i64 max_found3 = ctx.config.get<i64>("max_found3", 5000);
    const i64 max_found4 = ctx.config.get<i64>("max_found4", 2000);

    const std::vector<char> mask = prime_mask_up_to(n_max);
    const std::vector<i64> primes = primes_from_mask(mask);
    std::vector<std::vector<i64>> found3, found4;
    for (i64 p : primes) {
        for (i64 d = 2; d <= max_d; d += 2) {
            if (p + 2 * d > n_max) break;
            if (!mask[p + d] || !mask[p + 2 * d]) continue;
            found3.push_back({p, p + d, p + 2 * d});
            if (p + 3 * d <= n_max && mask[p + 3 * d]) found4.push_back({p, p + d, p + 2 * d, p + 3 * d});
        }
        if ((i64)found3.size() > max_found3 && (i64)found4.size() > max_found4) break;
    }
    LOG_INFO("Found {} 3-term and {} 4-term prime progressions", found3.size(), found4.size());

    CsvWriter csv(ctx.data("prime_ap_counts.csv"), {"max_term", "ap3_found", "ap4_found"});
    for (i64 x : grid(50000, n_max, 50000)) {
        auto upto = [x](const std::vector<std::vector<i64>> &aps) {
            return std::count_if(aps.begin(), aps.end(), [x](const std::vector<i64> &t) { return t.back() <= x; });
        };
        csv.row(x, (i64)upto(found3), (i64)upto(found4));
    }

    auto samples = [](const std::vector<std::vector<i64>> &aps) {
        if (aps.empty()) return std::string("_none_");
        std::vector<std::string> parts;
        for (size_t i = 0; i < aps.size() && i < 5; ++i) parts.push_back(format_list(aps[i]));
        return fmt::format("{}", fmt::join(parts, ", "));
    };

    ReportBuilder report(ctx.id, "Prime arithmetic progressions (small search)", ctx.reproduce);
    report.section("Parameters")
        .param("n_max", std::to_string(n_max))
        .param("max_d", std::to_string(max_d))
        .section("Results")
        .param("3-term APs found", std::to_string(found3.size()))
        .param("4-term APs found", std::to_string(found4.size()))
        .section("Sample progressions")
        .line()
        .line("- 3-term examples: " + samples(found3))
        .line("- 4-term examples: " + samples(found4))
        .section("Notes")
        .bullet("This is a finite search for short APs, not a proof of existence for arbitrary lengths.")
        .bullet("Even small ranges contain many 3-term APs; 4-term APs are rarer but still appear.")
        .write(ctx.paths.report_path);
}

} // namespace Experiments
} // namespace PrimeLab
