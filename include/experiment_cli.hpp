#pragma once
#include "types.hpp"
#include "primelab_config.hpp"
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace PrimeLab {

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ExperimentArgs {
    std::string out_dir;
    u64 seed = DEFAULT_SEED;
    bool verbose = false;
    bool help = false;
    std::string log_file;
    std::string config_file;
    std::vector<std::pair<std::string, std::string>> overrides;  // --set key=value
};

// Options following "run <id>"; --out is required unless --help is given
ExperimentArgs parse_experiment_args(const std::vector<std::string> &args);
ExperimentArgs parse_experiment_args(int argc, char **argv, int first = 1);

std::string experiment_usage(const std::string &prog);

// Non-negative decimal integer; throws UsageError naming the option
u64 parse_u64_arg(const std::string &option, const std::string &value);

// Single-quotes `s` for a POSIX shell unless it is made only of safe characters
std::string shell_quote(const std::string &s);

} // namespace PrimeLab
