#pragma once
#include "RegressionEnsemble.h"
#include "SimilarityReducer.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

struct PipelineConfig {
    std::string affinityPath;
    std::string responsePath;
    char delimiter = ',';

    // Affinity preprocessing
    bool transform = true;
    bool dedupe = true;
    std::vector<std::string> keep;
    double cutoff = 0.8;

    // Regression ensemble
    size_t repeats = 100;
    int folds = 3;
    uint32_t seed = 1337;
    bool parallel = true;
    int threads = 0; // 0 => OpenMP default
    size_t nLambda = 100;
    double lambdaMinRatio = -1.0; // -1 => 0.01 when drugs < proteins, else 1e-4
    std::string lambdaRule = "min"; // min|1se
    double tolerance = 1e-7;
    int maxIterations = 100000;
    bool standardize = false;

    size_t topK = 5;
    bool verbose = false;

    /**
     * @brief Builds config from CLI flags, after applying an optional --config file.
     * @post Returns a validated config object.
     * @throws DepInfer::ConfigurationException on invalid arguments or values.
     */
    static PipelineConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads values from a loose YAML/JSON-like key:value file.
     * @post Returns merged config using `base` as defaults.
     * @throws DepInfer::ConfigurationException on parse/validation failures.
     */
    static PipelineConfig fromFile(const std::string& configPath, const PipelineConfig& base);

    /**
     * @throws DepInfer::ConfigurationException when a value is outside its documented range.
     */
    void validate() const;

    // Input paths are only required by the CLI.
    void requireInputs() const;

    ReductionOptions reductionOptions() const;
    EnsembleOptions ensembleOptions() const;

    static std::string usage();
};
