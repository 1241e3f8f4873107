#include "experiment_cli.hpp"
#include <cerrno>
#include <cstdlib>

namespace PrimeLab {

u64 parse_u64_arg(const std::string &option, const std::string &value) {
    if (value.empty() || value[0] == '-' || value[0] == '+') {
        throw UsageError("invalid value for " + option + " (got '" + value + "')");
    }
    char *endptr = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(value.c_str(), &endptr, 10);
    if (*endptr != '\0' || errno == ERANGE) {
        throw UsageError("invalid value for " + option + " (got '" + value + "')");
    }
    return (u64)v;
}

std::string shell_quote(const std::string &s) {
    static const std::string safe =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789_@%+=:,./-";
    if (!s.empty() && s.find_first_not_of(safe) == std::string::npos) return s;
    std::string out = "'";
    for (char ch : s) {
        if (ch == '\'') out += "'\\''";
        else out += ch;
    }
    return out + "'";
}

ExperimentArgs parse_experiment_args(const std::vector<std::string> &args) {
    ExperimentArgs out;

    auto value_of = [&](size_t &i) -> const std::string & {
        if (i + 1 >= args.size()) {
            throw UsageError("missing value for " + args[i]);
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string &a = args[i];
        if (a == "--out") {
            out.out_dir = value_of(i);
        } else if (a == "--seed") {
            out.seed = parse_u64_arg("--seed", value_of(i));
        } else if (a == "-v" || a == "--verbose") {
            out.verbose = true;
        } else if (a == "--log-file") {
            out.log_file = value_of(i);
        } else if (a == "--config") {
            out.config_file = value_of(i);
        } else if (a == "--set") {
            const std::string &kv = value_of(i);
            size_t eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                throw UsageError("--set expects key=value (got '" + kv + "')");
            }
            out.overrides.emplace_back(kv.substr(0, eq), kv.substr(eq + 1));
        } else if (a == "-h" || a == "--help") {
            out.help = true;
        } else {
            throw UsageError("unknown option '" + a + "'");
        }
    }

    if (!out.help && out.out_dir.empty()) {
        throw UsageError("--out is required");
    }
    return out;
}

ExperimentArgs parse_experiment_args(int argc, char **argv, int first) {
    std::vector<std::string> args;
    for (int i = first; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_experiment_args(args);
}

std::string experiment_usage(const std::string &prog) {
    return "Usage:\n"
           "  " + prog + " list\n"
           "  " + prog + " run <id> --out DIR [--seed N] [-v] [--log-file FILE]\n"
           "        [--config FILE.yaml] [--set key=value ...]\n"
           "  " + prog + " isprime N\n"
           "  " + prog + " factor N [--seed N]\n"
           "  " + prog + " lucas-lehmer p\n"
           "  " + prog + " sigma N\n"
           "\nN may be a literal or a file whose first line holds the number.\n";
}

} // namespace PrimeLab
