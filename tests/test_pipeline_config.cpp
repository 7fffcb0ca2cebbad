#include "DepInferExceptions.h"
#include "PipelineConfig.h"
#include <gtest/gtest.h>
#include <fstream>
#include <string>
#include <vector>

namespace {
PipelineConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "depinfer");
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    return PipelineConfig::fromArgs(static_cast<int>(argv.size()), argv.data());
}

std::string writeTemp(const std::string& name, const std::string& content) {
    const std::string path = testing::TempDir() + name;
    std::ofstream out(path);
    out << content;
    return path;
}
} // namespace

TEST(PipelineConfig, DefaultsMatchTool) {
    PipelineConfig config;
    EXPECT_TRUE(config.transform);
    EXPECT_TRUE(config.dedupe);
    EXPECT_DOUBLE_EQ(config.cutoff, 0.8);
    EXPECT_EQ(config.repeats, 100u);
    EXPECT_EQ(config.folds, 3);
    EXPECT_NO_THROW(config.validate());

    const EnsembleOptions ensemble = config.ensembleOptions();
    EXPECT_EQ(ensemble.solver.rule, LambdaRule::MIN);
    EXPECT_FALSE(ensemble.solver.standardize);
    EXPECT_EQ(ensemble.solver.folds, 3);
}

TEST(PipelineConfig, ParsesFlags) {
    const PipelineConfig config = parse({"--affinity", "x.csv", "--response", "y.csv", "--cutoff", "0.65",
                                         "--keep", "EGFR, BRAF", "--repeats", "20", "--seed", "7",
                                         "--lambda-rule", "1SE", "--parallel", "false", "--delimiter", "tab",
                                         "--transform", "no", "--n-lambda", "50"});
    EXPECT_EQ(config.affinityPath, "x.csv");
    EXPECT_EQ(config.responsePath, "y.csv");
    EXPECT_DOUBLE_EQ(config.cutoff, 0.65);
    EXPECT_EQ(config.keep, (std::vector<std::string>{"EGFR", "BRAF"}));
    EXPECT_EQ(config.repeats, 20u);
    EXPECT_EQ(config.seed, 7u);
    EXPECT_FALSE(config.parallel);
    EXPECT_FALSE(config.transform);
    EXPECT_EQ(config.delimiter, '\t');
    EXPECT_NO_THROW(config.requireInputs());

    const ReductionOptions reduction = config.reductionOptions();
    EXPECT_EQ(reduction.keep, config.keep);
    EXPECT_FALSE(reduction.transform);
    const EnsembleOptions ensemble = config.ensembleOptions();
    EXPECT_EQ(ensemble.solver.rule, LambdaRule::ONE_SE);
    EXPECT_EQ(ensemble.solver.nLambda, 50u);
    EXPECT_EQ(ensemble.repeats, 20u);
}

TEST(PipelineConfig, RejectsBadValues) {
    EXPECT_THROW(parse({"--cutoff", "1.2"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--cutoff", "abc"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--repeats", "0"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--folds", "2"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--seed", "-4"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--lambda-rule", "max"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--verbose", "maybe"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--keep", "A,A"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--unknown-flag", "1"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"--cutoff"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({"stray"}), DepInfer::ConfigurationException);
    EXPECT_THROW(parse({}).requireInputs(), DepInfer::ConfigurationException);
}

TEST(PipelineConfig, LoadsLooseYamlAndJson) {
    const std::string yaml = writeTemp("depinfer_config.yaml",
                                       "# preprocessing\n"
                                       "cutoff: 0.9\n"
                                       "keep: \"MTOR,PIK3CA\"\n"
                                       "max-iterations: 500\n"
                                       "\n"
                                       "verbose: on\n");
    const PipelineConfig fromYaml = PipelineConfig::fromFile(yaml, PipelineConfig{});
    EXPECT_DOUBLE_EQ(fromYaml.cutoff, 0.9);
    EXPECT_EQ(fromYaml.keep, (std::vector<std::string>{"MTOR", "PIK3CA"}));
    EXPECT_EQ(fromYaml.maxIterations, 500);
    EXPECT_TRUE(fromYaml.verbose);

    const std::string json = writeTemp("depinfer_config.json",
                                       "{\n  \"repeats\": 12,\n  \"lambda_rule\": \"1se\",\n  \"affinity\": \"a:b.csv\"\n}\n");
    const PipelineConfig fromJson = PipelineConfig::fromFile(json, PipelineConfig{});
    EXPECT_EQ(fromJson.repeats, 12u);
    EXPECT_EQ(fromJson.lambdaRule, "1se");
    EXPECT_EQ(fromJson.affinityPath, "a:b.csv");
}

TEST(PipelineConfig, FlagsOverrideConfigFile) {
    const std::string path = writeTemp("depinfer_override.yaml", "cutoff: 0.9\nrepeats: 12\n");
    const PipelineConfig config = parse({"--cutoff", "0.7", "--config", path});
    EXPECT_DOUBLE_EQ(config.cutoff, 0.7);
    EXPECT_EQ(config.repeats, 12u);
}

TEST(PipelineConfig, FileErrorsNameTheLine) {
    const std::string path = writeTemp("depinfer_bad.yaml", "cutoff: 0.5\nfolds: two\n");
    try {
        PipelineConfig::fromFile(path, PipelineConfig{});
        FAIL() << "expected a configuration error";
    } catch (const DepInfer::ConfigurationException& e) {
        EXPECT_NE(std::string(e.what()).find("line 2"), std::string::npos);
    }
    EXPECT_THROW(PipelineConfig::fromFile(testing::TempDir() + "does_not_exist.yaml", PipelineConfig{}),
                 DepInfer::ConfigurationException);
}
