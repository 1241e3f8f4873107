// tests/experiment_config_test.cpp

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "experiment_config.hpp"

using namespace PrimeLab;

class ExperimentConfigTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("primelab_config_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::filesystem::create_directories(dir);
    }

    void TearDown() override { std::filesystem::remove_all(dir); }

    std::string write_yaml(const std::string &text) {
        auto path = dir / "config.yaml";
        std::ofstream(path) << text;
        return path.string();
    }
};

TEST_F(ExperimentConfigTest, DefaultsAreRecorded) {
    ExperimentConfig config;
    EXPECT_EQ(config.get<i64>("n_max", 100), 100);
    EXPECT_EQ(config.get<std::vector<i64>>("bases", {2, 3}), (std::vector<i64>{2, 3}));
    EXPECT_EQ(config.get("label", "abc"), "abc");
    EXPECT_EQ(config.params()["n_max"].asInt64(), 100);
    EXPECT_EQ(config.params()["bases"].size(), 2u);
    EXPECT_EQ(config.params()["label"].asString(), "abc");
}

TEST_F(ExperimentConfigTest, OverridesParseAsYaml) {
    ExperimentConfig config;
    config.set("n_max", "5000");
    config.set("bases", "[2, 3, 5]");
    config.set("require_q_prime", "false");
    config.set("near_band", "0.5");
    EXPECT_EQ(config.get<i64>("n_max", 1), 5000);
    EXPECT_EQ(config.get<std::vector<i64>>("bases", {}), (std::vector<i64>{2, 3, 5}));
    EXPECT_FALSE(config.get<bool>("require_q_prime", true));
    EXPECT_DOUBLE_EQ(config.get<double>("near_band", 0.02), 0.5);
    EXPECT_TRUE(config.unused_keys().empty());
}

TEST_F(ExperimentConfigTest, BadValueThrows) {
    ExperimentConfig config;
    config.set("n_max", "lots");
    EXPECT_THROW(config.get<i64>("n_max", 10), ConfigError);
}

TEST_F(ExperimentConfigTest, UnusedKeysAreReported) {
    ExperimentConfig config;
    config.set("n_max", "10");
    config.set("typo", "1");
    config.get<i64>("n_max", 1);
    EXPECT_EQ(config.unused_keys(), (std::vector<std::string>{"typo"}));
    EXPECT_TRUE(config.contains("typo"));
    EXPECT_FALSE(config.get<i64>("missing").has_value());
}

TEST_F(ExperimentConfigTest, LoadsExperimentSection) {
    auto path = write_yaml("e012:\n  n_max: 3000\n  base: 3\ne013:\n  n_max: 50\n");
    ExperimentConfig config;
    config.load_file(path, "e012");
    EXPECT_EQ(config.get<i64>("n_max", 0), 3000);
    EXPECT_EQ(config.get<i64>("base", 2), 3);
    EXPECT_FALSE(config.contains("e013.n_max"));
}

TEST_F(ExperimentConfigTest, LoadsRootAndFlattensNestedMaps) {
    auto path = write_yaml("n_max: 70\nsieve:\n  segment_size: 4096\n");
    ExperimentConfig config;
    config.load_file(path, "e017");
    EXPECT_EQ(config.get<i64>("n_max", 0), 70);
    EXPECT_EQ(config.get<i64>("sieve.segment_size", 0), 4096);
}

TEST_F(ExperimentConfigTest, MissingFileThrows) {
    ExperimentConfig config;
    EXPECT_THROW(config.load_file((dir / "nope.yaml").string(), "e012"), ConfigError);
    auto path = write_yaml("- 1\n- 2\n");
    EXPECT_THROW(config.load_file(path, "e012"), ConfigError);
}

TEST(RequireAtLeastTest, RejectsValuesBelowBound) {
    EXPECT_NO_THROW(require_at_least("q_max", 0, 0));
    EXPECT_NO_THROW(require_at_least("exponents", 31, 2));
    EXPECT_THROW(require_at_least("q_max", -1, 0), ConfigError);
    try {
        require_at_least("exponents", 1, 2);
        FAIL() << "expected ConfigError";
    } catch (const ConfigError &e) {
        EXPECT_STREQ(e.what(), "parameter 'exponents' must be >= 2 (got 1)");
    }
}
