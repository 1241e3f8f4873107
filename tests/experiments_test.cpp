// tests/experiments_test.cpp

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include "experiments.hpp"

using namespace PrimeLab;

namespace {

std::string read_file(const std::filesystem::path &path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string replace_all(std::string text, const std::string &from, const std::string &to) {
    for (size_t pos = text.find(from); pos != std::string::npos; pos = text.find(from, pos + to.size())) {
        text.replace(pos, from.size(), to);
    }
    return text;
}

// Splits one CSV line, honouring double-quoted cells
std::vector<std::string> split_csv_line(const std::string &line) {
    std::vector<std::string> cells(1);
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (quoted) {
            if (ch == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cells.back() += '"';
                ++i;
            } else if (ch == '"') {
                quoted = false;
            } else {
                cells.back() += ch;
            }
        } else if (ch == '"') {
            quoted = true;
        } else if (ch == ',') {
            cells.emplace_back();
        } else {
            cells.back() += ch;
        }
    }
    return cells;
}

// CSV rows with the named columns removed
std::vector<std::vector<std::string>> read_csv_without(const std::filesystem::path &path,
                                                       const std::set<std::string> &dropped) {
    std::ifstream in(path);
    std::string line;
    std::vector<std::vector<std::string>> rows;
    std::vector<bool> keep;
    while (std::getline(in, line)) {
        std::vector<std::string> cells = split_csv_line(line);
        if (keep.empty()) {
            for (const auto &name : cells) keep.push_back(!dropped.count(name));
        }
        std::vector<std::string> kept;
        for (size_t i = 0; i < cells.size(); ++i) {
            if (i >= keep.size() || keep[i]) kept.push_back(cells[i]);
        }
        rows.push_back(kept);
    }
    return rows;
}

}  // namespace

TEST(ExperimentRegistryTest, IdsAreUniqueAndOrdered) {
    const auto &registry = experiment_registry();
    ASSERT_EQ(registry.size(), 45u);
    std::set<std::string> ids;
    for (const auto &e : registry) {
        EXPECT_TRUE(ids.insert(e.id).second) << e.id;
        EXPECT_NE(e.run, nullptr) << e.id;
        EXPECT_STRNE(e.title, "") << e.id;
    }
    EXPECT_EQ(*ids.begin(), "e002");
    EXPECT_EQ(*ids.rbegin(), "e046");
}

TEST(ExperimentRegistryTest, Lookup) {
    ASSERT_NE(find_experiment("e041"), nullptr);
    EXPECT_STREQ(find_experiment("e041")->id, "e041");
    EXPECT_EQ(find_experiment("e001"), nullptr);
    EXPECT_EQ(find_experiment("E041"), nullptr);
}

TEST(ExperimentRegistryTest, UnknownIdIsUsageError) {
    ExperimentArgs args;
    args.out_dir = (std::filesystem::temp_directory_path() / "primelab_unknown").string();
    EXPECT_THROW(run_experiment("e999", args), UsageError);
    EXPECT_FALSE(std::filesystem::exists(args.out_dir));
}

TEST(ReproduceCommandTest, EchoesArgumentsShellQuoted) {
    ExperimentArgs args;
    args.out_dir = "runs/my run";
    args.seed = 5;
    args.config_file = "cfg.yaml";
    args.overrides = {{"n_max", "2000"}, {"bases", "[2, 3]"}};
    EXPECT_EQ(reproduce_command("e044", args),
              "primelab run e044 --out 'runs/my run' --seed 5 --config cfg.yaml "
              "--set n_max=2000 --set 'bases=[2, 3]'");
}

TEST(ReproduceCommandTest, ReportHoldsTheCommandOfTheRun) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "primelab_reproduce" / "e044 run";
    std::filesystem::remove_all(dir.parent_path());

    ExperimentArgs args;
    args.out_dir = dir.string();
    args.seed = 9;
    args.overrides = {{"samples", "50"}, {"bits", "20"}, {"bases", "[2, 3]"}};
    run_experiment("e044", args);

    const std::string expected = "```bash\nprimelab run e044 --out '" + dir.string() +
                                 "' --seed 9 --set samples=50 --set bits=20 --set 'bases=[2, 3]'\n```\n";
    EXPECT_NE(read_file(dir / "report.md").find(expected), std::string::npos) << read_file(dir / "report.md");

    std::filesystem::remove_all(dir.parent_path());
}

TEST(ExperimentParameterTest, NegativeBoundsAreConfigErrors) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "primelab_bounds";
    ExperimentArgs args;
    args.out_dir = dir.string();

    args.overrides = {{"p_max", "50"}, {"q_max", "-1"}};
    EXPECT_THROW(run_experiment("e009", args), ConfigError);

    args.overrides = {{"exponents", "[3, -1]"}};
    EXPECT_THROW(run_experiment("e002", args), ConfigError);

    args.overrides = {{"n_max", "2000"}, {"max_listed", "-5"}};
    EXPECT_THROW(run_experiment("e012", args), ConfigError);

    std::filesystem::remove_all(dir);
}

TEST(ExperimentOutputTest, LiarSeriesHasOnlyNumericRows) {
    const std::filesystem::path dir = std::filesystem::temp_directory_path() / "primelab_liar_rows";
    std::filesystem::remove_all(dir);
    ExperimentArgs args;
    args.out_dir = dir.string();
    args.overrides = {{"samples", "2000"}, {"bits", "12"}, {"bases", "[2]"}};
    run_experiment("e044", args);

    const auto rows = read_csv_without(dir / "data" / "ss_vs_mr_liars.csv", {});
    ASSERT_FALSE(rows.empty());
    EXPECT_EQ(rows[0], (std::vector<std::string>{"composite_index", "n", "ss_liars", "mr_liars"}));
    for (size_t i = 1; i < rows.size(); ++i) {
        ASSERT_EQ(rows[i].size(), 4u);
        for (const auto &cell : rows[i]) {
            EXPECT_FALSE(cell.empty()) << "row " << i;
            EXPECT_EQ(cell.find_first_not_of("0123456789"), std::string::npos) << cell;
        }
    }
    EXPECT_NE(read_file(dir / "report.md").find("- composites sampled: `"), std::string::npos);
    std::filesystem::remove_all(dir);
}

struct SmokeCase {
    const char *id;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::string> data_files;
};

void PrintTo(const SmokeCase &c, std::ostream *os) { *os << c.id; }

class ExperimentSmokeTest : public ::testing::TestWithParam<SmokeCase> {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / (std::string("primelab_smoke_") + GetParam().id);
        std::filesystem::remove_all(dir);
    }

    void TearDown() override { std::filesystem::remove_all(dir); }
};

TEST_P(ExperimentSmokeTest, WritesReportParamsAndData) {
    const SmokeCase &c = GetParam();
    ExperimentArgs args;
    args.out_dir = dir.string();
    args.seed = 1234;
    args.overrides = c.overrides;

    ASSERT_NO_THROW(run_experiment(c.id, args));

    ASSERT_TRUE(std::filesystem::exists(dir / "report.md"));
    ASSERT_TRUE(std::filesystem::exists(dir / "params.json"));
    for (const auto &f : c.data_files) {
        EXPECT_TRUE(std::filesystem::exists(dir / "data" / f)) << f;
    }

    std::ifstream report(dir / "report.md");
    std::string first_line;
    std::getline(report, first_line);
    std::string upper = c.id;
    upper[0] = 'E';
    EXPECT_EQ(first_line.rfind("# " + upper + " — ", 0), 0u) << first_line;

    Json::Value params;
    std::ifstream in(dir / "params.json");
    Json::CharReaderBuilder builder;
    std::string errs;
    ASSERT_TRUE(Json::parseFromStream(builder, in, &params, &errs)) << errs;
    EXPECT_EQ(params["seed"].asUInt64(), 1234u);
    for (const auto &[k, v] : c.overrides) {
        EXPECT_TRUE(params.isMember(k)) << k;
    }
}

INSTANTIATE_TEST_SUITE_P(
    AllExperiments, ExperimentSmokeTest,
    ::testing::Values(
        SmokeCase{"e002", {}, {}},
        SmokeCase{"e003", {{"n_max", "2000"}, {"bins", "20"}}, {}},
        SmokeCase{"e004", {{"n_values", "[1000, 2000]"}, {"trials", "1"}, {"max_n_factor", "2000"}}, {}},
        SmokeCase{"e005", {{"n_max", "2000"}}, {}},
        SmokeCase{"e006", {{"n_max", "2000"}, {"top_k", "5"}}, {}},
        SmokeCase{"e007", {{"n_max", "1000"}}, {}},
        SmokeCase{"e008", {{"p_max", "200"}, {"max_tests", "20"}}, {}},
        SmokeCase{"e009", {{"p_max", "200"}, {"max_tests", "20"}, {"q_max", "10000"}}, {}},
        SmokeCase{"e010", {{"p_max", "200"}, {"max_tests", "20"}}, {}},
        SmokeCase{"e011", {{"p_max", "200"}, {"max_tests", "20"}}, {}},
        SmokeCase{"e012", {{"n_max", "2000"}}, {"pseudoprimes.csv"}},
        SmokeCase{"e013", {{"n_max", "60"}}, {}},
        SmokeCase{"e014", {{"k_max", "8"}}, {}},
        SmokeCase{"e015", {{"n_values", "[50, 100]"}}, {"wilson_runtime.csv"}},
        SmokeCase{"e016", {{"bit_sizes", "[12, 16]"}, {"samples_per_size", "10"}}, {"trial_vs_mr.csv"}},
        SmokeCase{"e017", {{"n_values", "[1000, 5000]"}, {"segment_size", "512"}}, {}},
        SmokeCase{"e018", {{"n_max", "5000"}}, {"mr_liars_cumulative.csv"}},
        SmokeCase{"e019", {{"n_max", "5000"}, {"stride", "10"}}, {}},
        SmokeCase{"e020", {{"n_max", "5000"}, {"step", "100"}}, {"pi_vs_li.csv"}},
        SmokeCase{"e021", {{"n_max", "5000"}, {"stride", "10"}}, {}},
        SmokeCase{"e022", {{"n_max", "5000"}, {"stride", "10"}}, {}},
        SmokeCase{"e023", {{"n_max", "5000"}, {"stride", "10"}}, {}},
        SmokeCase{"e024", {{"size", "11"}}, {"ulam_spiral.csv"}},
        SmokeCase{"e025", {{"n_max", "2000"}}, {}},
        SmokeCase{"e026", {{"n_max", "5000"}, {"bins", "10"}}, {}},
        SmokeCase{"e027", {{"n_max", "10000"}}, {}},
        SmokeCase{"e028", {{"n_max", "20000"}, {"window", "500"}, {"step", "500"}}, {"jumping_champions.csv"}},
        SmokeCase{"e029", {{"n_max", "20000"}, {"x_step", "1000"}}, {}},
        SmokeCase{"e030", {{"n_max", "20000"}, {"x_step", "1000"}}, {}},
        SmokeCase{"e031", {{"max_mod", "13"}}, {"admissibility.csv"}},
        SmokeCase{"e032", {{"n_max", "20000"}, {"x_step", "1000"}}, {}},
        SmokeCase{"e033", {{"n_max", "20000"}, {"threshold", "20"}, {"stride", "10"}}, {}},
        SmokeCase{"e034", {{"n_max", "20000"}, {"window", "5000"}, {"step", "2000"}}, {"twin_windows.csv"}},
        SmokeCase{"e035", {{"n_max", "20000"}, {"stride", "10"}}, {}},
        SmokeCase{"e036", {{"n_max", "5000"}, {"max_d", "300"}, {"max_found3", "50"}, {"max_found4", "20"}}, {}},
        SmokeCase{"e037", {{"n_values", "[5, 10]"}}, {}},
        SmokeCase{"e038", {{"n_max", "2000"}, {"stride", "10"}}, {}},
        SmokeCase{"e039", {{"n_max", "20000"}, {"x_step", "1000"}}, {}},
        SmokeCase{"e040", {{"limit", "2000"}}, {}},
        SmokeCase{"e041", {{"m_max", "5"}, {"factor_m_max", "5"}}, {}},
        SmokeCase{"e042", {{"k_max", "8"}}, {}},
        SmokeCase{"e043", {{"samples", "5"}, {"bits", "16"}}, {}},
        SmokeCase{"e044", {{"samples", "200"}, {"bits", "20"}}, {"ss_vs_mr_liars.csv"}},
        SmokeCase{"e045", {{"samples", "200"}, {"bits", "32"}}, {"mr_base_set_passes.csv"}},
        SmokeCase{"e046", {{"n_max", "20000"}}, {"pipeline_errors.csv"}}),
    [](const ::testing::TestParamInfo<SmokeCase> &info) { return std::string(info.param.id); });

struct RepeatCase {
    const char *id;
    std::vector<std::pair<std::string, std::string>> overrides;
    std::set<std::string> timing_columns;
    bool report_has_timings;
};

void PrintTo(const RepeatCase &c, std::ostream *os) { *os << c.id; }

class ExperimentRepeatTest : public ::testing::TestWithParam<RepeatCase> {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() / (std::string("primelab_repeat_") + GetParam().id);
        std::filesystem::remove_all(dir);
    }

    void TearDown() override { std::filesystem::remove_all(dir); }

    std::filesystem::path run_into(const std::string &name) {
        ExperimentArgs args;
        args.out_dir = (dir / name).string();
        args.seed = 7;
        args.overrides = GetParam().overrides;
        run_experiment(GetParam().id, args);
        return dir / name;
    }
};

TEST_P(ExperimentRepeatTest, SameSeedGivesSameArtifacts) {
    const RepeatCase &c = GetParam();
    const std::filesystem::path a = run_into("a");
    const std::filesystem::path b = run_into("b");

    EXPECT_EQ(read_file(a / "params.json"), read_file(b / "params.json"));

    if (!c.report_has_timings) {
        // The reproduce line names the output directory
        EXPECT_EQ(replace_all(read_file(a / "report.md"), a.string(), "OUT"),
                  replace_all(read_file(b / "report.md"), b.string(), "OUT"));
    }

    size_t csv_files = 0;
    for (const auto &entry : std::filesystem::directory_iterator(a / "data")) {
        const std::filesystem::path name = entry.path().filename();
        ASSERT_TRUE(std::filesystem::exists(b / "data" / name)) << name;
        EXPECT_EQ(read_csv_without(a / "data" / name, c.timing_columns),
                  read_csv_without(b / "data" / name, c.timing_columns))
            << name;
        ++csv_files;
    }
    EXPECT_GT(csv_files, 0u);
}

INSTANTIATE_TEST_SUITE_P(
    SeededExperiments, ExperimentRepeatTest,
    ::testing::Values(
        RepeatCase{"e012", {{"n_max", "3000"}}, {}, false},
        RepeatCase{"e013", {{"n_max", "60"}}, {}, false},
        RepeatCase{"e014", {{"k_max", "8"}}, {}, false},
        RepeatCase{"e016", {{"bit_sizes", "[12, 16]"}, {"samples_per_size", "20"}}, {"trial_ms", "mr_ms"}, true},
        RepeatCase{"e024", {{"size", "15"}}, {}, false},
        RepeatCase{"e040", {{"limit", "2000"}}, {}, false},
        RepeatCase{"e041", {{"m_max", "5"}, {"factor_m_max", "5"}}, {}, false},
        RepeatCase{"e043", {{"samples", "6"}, {"bits", "16"}}, {"time_ms"}, true},
        RepeatCase{"e044", {{"samples", "300"}, {"bits", "20"}}, {}, false},
        RepeatCase{"e045", {{"samples", "300"}, {"bits", "32"}}, {}, false},
        RepeatCase{"e046", {{"n_max", "20000"}}, {}, false}),
    [](const ::testing::TestParamInfo<RepeatCase> &info) { return std::string(info.param.id); });
