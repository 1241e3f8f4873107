#include "experiments.hpp"
#include "logger.hpp"
#include "timing.hpp"

namespace PrimeLab {

const std::vector<ExperimentInfo> &experiment_registry() {
    using namespace Experiments;
    static const std::vector<ExperimentInfo> registry = {
        {"e002", "Even perfect numbers: growth from Mersenne exponents", run_e002},
        {"e003", "Abundancy index landscape", run_e003},
        {"e004", "Computing sigma(n): sieve vs factorization", run_e004},
        {"e005", "Odd perfect numbers: constraint filter pipeline", run_e005},
        {"e006", "Near misses to perfection: sigma(n) close to 2n", run_e006},
        {"e007", "Mersenne numbers: digit and bit growth", run_e007},
        {"e008", "Lucas–Lehmer scan over prime exponents", run_e008},
        {"e009", "Small-factor scan: q | 2^p - 1 with q ≡ 1 (mod 2p)", run_e009},
        {"e010", "Perfect numbers from Mersenne primes", run_e010},
        {"e011", "Mersenne primes: heuristic expectation vs observed", run_e011},
        {"e012", "Fermat pseudoprimes and Carmichael numbers", run_e012},
        {"e013", "Prime-polynomial counterexamples (Euler's n^2 + n + 41)", run_e013},
        {"e014", "Primorial ± 1 counterexamples", run_e014},
        {"e015", "Wilson test infeasibility (runtime counterexample)", run_e015},
        {"e016", "Trial division vs Miller–Rabin scaling", run_e016},
        {"e017", "Sieve memory blow-up vs segmented sieve", run_e017},
        {"e018", "Miller–Rabin base choice counterexamples", run_e018},
        {"e019", "Prime density and PNT visualization", run_e019},
        {"e020", "Compare pi(x) to li(x) numerically", run_e020},
        {"e021", "Explicit bounds sanity checks", run_e021},
        {"e022", "Prime race modulo 4", run_e022},
        {"e023", "Residue class distribution mod q", run_e023},
        {"e024", "Ulam spiral structure", run_e024},
        {"e025", "Prime gaps are not monotone", run_e025},
        {"e026", "Normalized prime gaps", run_e026},
        {"e027", "Record prime gaps vs log^2 heuristic", run_e027},
        {"e028", "Jumping champions (most frequent gaps)", run_e028},
        {"e029", "Twin primes: observed vs heuristic", run_e029},
        {"e030", "Cousin and sexy prime pairs", run_e030},
        {"e031", "Admissibility and modular obstructions", run_e031},
        {"e032", "Prime triplets and quadruplets", run_e032},
        {"e033", "Bounded gaps vs twin primes (not the same)", run_e033},
        {"e034", "Twin primes in sliding windows", run_e034},
        {"e035", "Primes in arithmetic progressions", run_e035},
        {"e036", "Prime arithmetic progressions (small search)", run_e036},
        {"e037", "Prime-free intervals via factorial construction", run_e037},
        {"e038", "Bertrand's postulate (computational verification)", run_e038},
        {"e039", "Sophie Germain and safe primes", run_e039},
        {"e040", "Palindromic primes and the '11 trap'", run_e040},
        {"e041", "Fermat numbers: prime for m<=4, composite afterwards", run_e041},
        {"e042", "Repunit primes (small k scan)", run_e042},
        {"e043", "Pollard rho runtime variability", run_e043},
        {"e044", "Solovay–Strassen vs Miller–Rabin (liars)", run_e044},
        {"e045", "Deterministic 64-bit MR base sets", run_e045},
        {"e046", "Prime-testing pipeline and tuning pitfalls", run_e046},
    };
    return registry;
}

const ExperimentInfo *find_experiment(const std::string &id) {
    for (const auto &e : experiment_registry()) {
        if (id == e.id) return &e;
    }
    return nullptr;
}

std::string reproduce_command(const std::string &id, const ExperimentArgs &args) {
    std::string cmd = "primelab run " + id + " --out " + shell_quote(args.out_dir) +
                      " --seed " + std::to_string(args.seed);
    if (!args.config_file.empty()) cmd += " --config " + shell_quote(args.config_file);
    for (const auto &[k, v] : args.overrides) cmd += " --set " + shell_quote(k + "=" + v);
    return cmd;
}

void run_experiment(const std::string &id, const ExperimentArgs &args) {
    const ExperimentInfo *info = find_experiment(id);
    if (!info) {
        throw UsageError("unknown experiment '" + id + "' (see 'primelab list')");
    }

    Logger::init(args.verbose, args.log_file);

    ExperimentConfig config;
    if (!args.config_file.empty()) config.load_file(args.config_file, id);
    for (const auto &[k, v] : args.overrides) config.set(k, v);

    ExperimentContext ctx{id, info->title, args.seed, prepare_out_dir(args.out_dir), config,
                          reproduce_command(id, args)};

    LOG_INFO("Starting experiment {} (seed={})", id, args.seed);
    auto t0 = now_tp();
    info->run(ctx);

    Json::Value params = config.params();
    params["seed"] = Json::Value((Json::UInt64)args.seed);
    write_json(ctx.paths.params_path, params);

    for (const auto &key : config.unused_keys()) {
        LOG_WARN("Configuration key '{}' is not used by {}", key, id);
    }
    LOG_INFO("Experiment {} completed in {:.1f} ms. Artifacts saved to: {}", id, ms_since(t0),
             ctx.paths.root.string());
}

} // namespace PrimeLab
