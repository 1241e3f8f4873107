#include "../include/bigint_utils.hpp"
#include "../include/divisors.hpp"
#include "../include/experiments.hpp"
#include "../include/factorization.hpp"
#include "../include/logger.hpp"
#include "../include/mersenne.hpp"
#include "../include/primality.hpp"
#include "../include/timing.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

using namespace PrimeLab;

// N is either a literal or a file whose first line holds the number
static cpp_int read_number_arg(const char *arg) {
  std::string Ns;
  std::ifstream fin(arg);
  if (fin) { std::getline(fin, Ns); fin.close(); }
  else     { Ns = arg; }
  try {
    return read_big_decimal(Ns);
  } catch (const std::invalid_argument &e) {
    throw UsageError(e.what());
  }
}

static void require_args(int argc, int needed, const char *cmd) {
  if (argc < needed) {
    throw UsageError(std::string("missing argument for '") + cmd + "'");
  }
}

static int cmd_list() {
  for (const auto &e : experiment_registry()) {
    printf("%s  %s\n", e.id, e.title);
  }
  return 0;
}

static int cmd_run(int argc, char **argv) {
  require_args(argc, 3, "run");
  ExperimentArgs args = parse_experiment_args(argc, argv, 3);
  if (args.help) {
    printf("%s", experiment_usage(argv[0]).c_str());
    return 0;
  }
  run_experiment(argv[2], args);
  return 0;
}

static int cmd_isprime(int argc, char **argv) {
  require_args(argc, 3, "isprime");
  cpp_int N = read_number_arg(argv[2]);

  auto t0 = now_tp();
  bool mr = is_prime_deterministic_64(N);
  double mr_ms = ms_since(t0);
  t0 = now_tp();
  bool ss = is_probable_prime_solovay_strassen(N, MR_BASES_64BIT_12);
  double ss_ms = ms_since(t0);

  const char *mr_kind = fits_u64(N) ? "deterministic" : "probable";
  printf("N = %s (%zu bits)\n", N.str().c_str(), bitlen(N));
  printf("Miller-Rabin (12 bases, %s): %s  [%.3f ms]\n", mr_kind, mr ? "prime" : "composite", mr_ms);
  printf("Solovay-Strassen (12 bases):   %s  [%.3f ms]\n", ss ? "probable prime" : "composite", ss_ms);
  if (mr != ss) LOG_WARN("Miller-Rabin and Solovay-Strassen disagree on {}", N.str());
  return 0;
}

static int cmd_factor(int argc, char **argv) {
  require_args(argc, 3, "factor");
  cpp_int N = read_number_arg(argv[2]);
  if (N < 1) {
    throw UsageError("factor: N must be >= 1");
  }
  u64 seed = DEFAULT_SEED;
  for (int i = 3; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--seed" && i + 1 < argc) {
      seed = parse_u64_arg("--seed", argv[++i]);
    } else {
      throw UsageError("factor: unexpected argument '" + a + "'");
    }
  }

  auto t0 = now_tp();
  std::vector<cpp_int> factors = factorize_pollard_rho(N, seed);
  double ms = ms_since(t0);
  printf("%s = %s\n", N.str().c_str(), format_factor_multiset(factors).c_str());
  LOG_DEBUG("Factored {} in {:.3f} ms (seed={})", N.str(), ms, seed);
  return 0;
}

static int cmd_lucas_lehmer(int argc, char **argv) {
  require_args(argc, 3, "lucas-lehmer");
  u64 p = parse_u64_arg("p", argv[2]);
  if (p < 2 || p > 1000000) {
    throw UsageError("lucas-lehmer: p must be in [2, 1000000]");
  }
  if (!is_prime_deterministic_64(p)) {
    // p = ab gives 2^a - 1 | 2^p - 1
    printf("M_%llu = 2^%llu - 1 is composite (p is composite)\n", (unsigned long long)p, (unsigned long long)p);
    return 0;
  }
  auto t0 = now_tp();
  bool prime = lucas_lehmer_is_prime((unsigned)p);
  double ms = ms_since(t0);
  printf("M_%llu = 2^%llu - 1 is %s  [%.3f ms, %lld digits]\n", (unsigned long long)p, (unsigned long long)p,
         prime ? "prime" : "composite", ms, (long long)mersenne_digits((i64)p));
  return 0;
}

static int cmd_sigma(int argc, char **argv) {
  require_args(argc, 3, "sigma");
  cpp_int N = read_number_arg(argv[2]);
  if (N < 1 || !fits_u64(N)) {
    throw UsageError("sigma: N must be in [1, 2^64)");
  }
  const u64 n = N.convert_to<u64>();

  Factorization f;
  for (u64 p : factorize_pollard_rho(n)) ++f[p];
  const u64 s = sigma_from_factorization(f);
  const double index = (double)s / (double)n;
  const char *kind = s == 2 * (u128)n ? "perfect" : (s > 2 * (u128)n ? "abundant" : "deficient");

  printf("n = %s = %s\n", N.str().c_str(), format_factorization(f).c_str());
  printf("sigma(n) = %llu\n", (unsigned long long)s);
  printf("sigma(n)/n = %.12f (%s)\n", index, kind);
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    fprintf(stderr, "%s", experiment_usage(argv[0]).c_str());
    return 2;
  }
  const std::string cmd = argv[1];

  try {
    if (cmd == "-h" || cmd == "--help" || cmd == "help") {
      printf("%s", experiment_usage(argv[0]).c_str());
      return 0;
    }
    if (cmd == "list")         return cmd_list();
    if (cmd == "run")          return cmd_run(argc, argv);
    if (cmd == "isprime")      return cmd_isprime(argc, argv);
    if (cmd == "factor")       return cmd_factor(argc, argv);
    if (cmd == "lucas-lehmer") return cmd_lucas_lehmer(argc, argv);
    if (cmd == "sigma")        return cmd_sigma(argc, argv);
    throw UsageError("unknown command '" + cmd + "'");
  } catch (const UsageError &e) {
    fprintf(stderr, "Error: %s\n\n%s", e.what(), experiment_usage(argv[0]).c_str());
    return 2;
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
}
