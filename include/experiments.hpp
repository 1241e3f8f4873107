#pragma once
#include "types.hpp"
#include "experiment_cli.hpp"
#include "experiment_config.hpp"
#include "experiment_io.hpp"
#include <string>
#include <vector>

namespace PrimeLab {

struct ExperimentContext {
    std::string id;
    std::string title;
    u64 seed;
    RunPaths paths;
    ExperimentConfig &config;
    std::string reproduce;  // command line that regenerates this run

    std::filesystem::path data(const std::string &name) const { return paths.data_dir / name; }
};

using ExperimentFn = void (*)(ExperimentContext &);

struct ExperimentInfo {
    const char *id;
    const char *title;
    ExperimentFn run;
};

const std::vector<ExperimentInfo> &experiment_registry();
const ExperimentInfo *find_experiment(const std::string &id);

// Command line that regenerates a run with these arguments
std::string reproduce_command(const std::string &id, const ExperimentArgs &args);

// Sets up logging, config and the output directory, runs, then writes params.json
void run_experiment(const std::string &id, const ExperimentArgs &args);

namespace Experiments {

// Perfect numbers and sigma(n)
void run_e002(ExperimentContext &ctx);
void run_e003(ExperimentContext &ctx);
void run_e004(ExperimentContext &ctx);
void run_e005(ExperimentContext &ctx);
void run_e006(ExperimentContext &ctx);
void run_e010(ExperimentContext &ctx);

// Mersenne numbers
void run_e007(ExperimentContext &ctx);
void run_e008(ExperimentContext &ctx);
void run_e009(ExperimentContext &ctx);
void run_e011(ExperimentContext &ctx);

// Primality testing and pseudoprimes
void run_e012(ExperimentContext &ctx);
void run_e015(ExperimentContext &ctx);
void run_e016(ExperimentContext &ctx);
void run_e018(ExperimentContext &ctx);
void run_e044(ExperimentContext &ctx);
void run_e045(ExperimentContext &ctx);
void run_e046(ExperimentContext &ctx);

// Distribution of primes
void run_e017(ExperimentContext &ctx);
void run_e019(ExperimentContext &ctx);
void run_e020(ExperimentContext &ctx);
void run_e021(ExperimentContext &ctx);
void run_e022(ExperimentContext &ctx);
void run_e023(ExperimentContext &ctx);
void run_e024(ExperimentContext &ctx);
void run_e035(ExperimentContext &ctx);
void run_e038(ExperimentContext &ctx);

// Gaps and constellations
void run_e025(ExperimentContext &ctx);
void run_e026(ExperimentContext &ctx);
void run_e027(ExperimentContext &ctx);
void run_e028(ExperimentContext &ctx);
void run_e029(ExperimentContext &ctx);
void run_e030(ExperimentContext &ctx);
void run_e031(ExperimentContext &ctx);
void run_e032(ExperimentContext &ctx);
void run_e033(ExperimentContext &ctx);
void run_e034(ExperimentContext &ctx);
void run_e036(ExperimentContext &ctx);

// Special forms
void run_e013(ExperimentContext &ctx);
void run_e014(ExperimentContext &ctx);
void run_e037(ExperimentContext &ctx);
void run_e039(ExperimentContext &ctx);
void run_e040(ExperimentContext &ctx);
void run_e041(ExperimentContext &ctx);
void run_e042(ExperimentContext &ctx);
void run_e043(ExperimentContext &ctx);

} // namespace Experiments
} // namespace PrimeLab
