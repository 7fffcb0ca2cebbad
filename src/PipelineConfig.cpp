#include "PipelineConfig.h"
#include "CommonUtils.h"
#include "DepInferExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <unordered_map>
#include <unordered_set>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value,
                     const std::string& key,
                     const std::string& errorPrefix,
                     Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw DepInfer::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const DepInfer::DepInferException&) {
        throw;
    } catch (const std::exception& ex) {
        throw DepInfer::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

int parseIntStrict(const std::string& value, const std::string& key, int minValue) {
    int parsed = parseNumericStrict<int>(
        value,
        key,
        "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoi(v, pos); });
    if (parsed < minValue) {
        throw DepInfer::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return parsed;
}

uint32_t parseUIntStrict(const std::string& value, const std::string& key) {
    if (!value.empty() && value.front() == '-') {
        throw DepInfer::ConfigurationException("Invalid unsigned integer for " + key + ": " + value);
    }
    unsigned long parsed = parseNumericStrict<unsigned long>(
        value,
        key,
        "Invalid unsigned integer for ",
        [](const std::string& v, size_t* pos) { return std::stoul(v, pos); });
    if (parsed > static_cast<unsigned long>(std::numeric_limits<uint32_t>::max())) {
        throw DepInfer::ConfigurationException("Value for " + key + " exceeds uint32 range");
    }
    return static_cast<uint32_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    double parsed = parseNumericStrict<double>(
        value,
        key,
        "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed) || parsed < minValue) {
        throw DepInfer::ConfigurationException("Value for " + key + " must be finite and >= " + std::to_string(minValue));
    }
    return parsed;
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    std::string v = CommonUtils::toLower(CommonUtils::trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw DepInfer::ConfigurationException("Invalid boolean for " + key + ": " + value);
}

std::string stripStructuralTokensOutsideQuotes(const std::string& line) {
    std::string out;
    out.reserve(line.size());

    bool inQuotes = false;
    for (char c : line) {
        if (c == '"') {
            inQuotes = !inQuotes;
            out.push_back(c);
            continue;
        }
        if (!inQuotes && (c == '{' || c == '}')) continue;
        out.push_back(c);
    }

    size_t lastNonSpace = out.find_last_not_of(" \t\r\n");
    if (lastNonSpace != std::string::npos && out[lastNonSpace] == ',') {
        out.erase(lastNonSpace, 1);
    }
    return out;
}

size_t findSeparatorOutsideQuotes(const std::string& line, char sep) {
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            inQuotes = !inQuotes;
            continue;
        }
        if (!inQuotes && line[i] == sep) return i;
    }
    return std::string::npos;
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(const std::string& key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(PipelineConfig& config, const std::string& key, const std::string& value) {
    if (key == "delimiter") {
        if (value == "\\t" || CommonUtils::toLower(value) == "tab") {
            config.delimiter = '\t';
            return;
        }
        if (value.size() != 1) throw DepInfer::ConfigurationException("delimiter expects a single character");
        config.delimiter = value[0];
        return;
    }
    if (key == "keep") {
        config.keep = CommonUtils::splitList(value);
        return;
    }
    if (key == "lambda_min_ratio") {
        config.lambdaMinRatio = parseDoubleStrict(value, key, -1.0);
        return;
    }

    struct IntRule {
        int PipelineConfig::*member;
        int minValue;
    };
    struct SizeRule {
        size_t PipelineConfig::*member;
        int minValue;
    };
    struct DoubleRule {
        double PipelineConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string PipelineConfig::*> rawStringFields = {
        {"affinity", &PipelineConfig::affinityPath},
        {"response", &PipelineConfig::responsePath}
    };
    static const std::unordered_map<std::string, std::string PipelineConfig::*> lowerStringFields = {
        {"lambda_rule", &PipelineConfig::lambdaRule}
    };
    static const std::unordered_map<std::string, bool PipelineConfig::*> boolFields = {
        {"transform", &PipelineConfig::transform},
        {"dedupe", &PipelineConfig::dedupe},
        {"parallel", &PipelineConfig::parallel},
        {"standardize", &PipelineConfig::standardize},
        {"verbose", &PipelineConfig::verbose}
    };
    static const std::unordered_map<std::string, IntRule> intFields = {
        {"folds", {&PipelineConfig::folds, 3}},
        {"threads", {&PipelineConfig::threads, 0}},
        {"max_iterations", {&PipelineConfig::maxIterations, 1}}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"repeats", {&PipelineConfig::repeats, 1}},
        {"n_lambda", {&PipelineConfig::nLambda, 1}},
        {"top_k", {&PipelineConfig::topK, 0}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"cutoff", {&PipelineConfig::cutoff, 0.0}},
        {"tolerance", {&PipelineConfig::tolerance, 0.0}}
    };

    if (const auto it = rawStringFields.find(key); it != rawStringFields.end()) {
        config.*(it->second) = value;
        return;
    }
    if (const auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(value);
        return;
    }
    if (const auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (key == "seed") {
        config.seed = parseUIntStrict(value, key);
        return;
    }
    if (const auto it = intFields.find(key); it != intFields.end()) {
        config.*(it->second.member) = parseIntStrict(value, key, it->second.minValue);
        return;
    }
    if (const auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = static_cast<size_t>(parseIntStrict(value, key, it->second.minValue));
        return;
    }
    if (const auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    throw DepInfer::ConfigurationException("Unknown option: " + key);
}
} // namespace

std::string PipelineConfig::usage() {
    return "Usage: depinfer --affinity <drugs_x_proteins.csv> --response <drugs_x_samples.csv> [--config path] "
           "[--delimiter ,] [--transform true|false] [--dedupe true|false] [--keep P1,P2] [--cutoff 0..1] "
           "[--repeats N] [--folds N>=3] [--seed N] [--parallel true|false] [--threads N] [--n-lambda N] "
           "[--lambda-min-ratio -1|>0] [--lambda-rule min|1se] [--tolerance >0] [--max-iterations N] "
           "[--standardize true|false] [--top-k N] [--verbose true|false]";
}

PipelineConfig PipelineConfig::fromArgs(int argc, char* argv[]) {
    PipelineConfig config;

    // Config file first so explicit flags win.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw DepInfer::ConfigurationException("--config expects a path");
            config = fromFile(argv[i + 1], config);
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
            throw DepInfer::ConfigurationException("Unexpected argument '" + arg + "'\n" + usage());
        }
        if (i + 1 >= argc) {
            throw DepInfer::ConfigurationException("Missing value for " + arg);
        }
        const std::string value = argv[++i];
        if (arg == "--config") continue;
        assignKeyValue(config, normalizeConfigKey(arg.substr(2)), value);
    }

    config.validate();
    return config;
}

PipelineConfig PipelineConfig::fromFile(const std::string& configPath, const PipelineConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw DepInfer::ConfigurationException("Could not open config file: " + configPath);

    PipelineConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        // Loose YAML (key: value) and loose JSON ("key": "value",)
        line = CommonUtils::trim(stripStructuralTokensOutsideQuotes(line));
        if (line.empty()) continue;

        const size_t sep = findSeparatorOutsideQuotes(line, ':');
        if (sep == std::string::npos) continue;

        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const DepInfer::DepInferException& ex) {
            throw DepInfer::ConfigurationException(
                "Config parse error at line " + std::to_string(lineNo) +
                ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();

    return config;
}

void PipelineConfig::validate() const {
    if (cutoff < 0.0 || cutoff > 1.0) {
        throw DepInfer::ConfigurationException("cutoff must be within [0,1]");
    }
    if (repeats < 1) {
        throw DepInfer::ConfigurationException("repeats must be >= 1");
    }
    if (folds < 3) {
        throw DepInfer::ConfigurationException("folds must be >= 3");
    }
    if (threads < 0) {
        throw DepInfer::ConfigurationException("threads must be >= 0");
    }
    if (nLambda < 1) {
        throw DepInfer::ConfigurationException("n_lambda must be >= 1");
    }
    if (lambdaMinRatio != -1.0 && (lambdaMinRatio <= 0.0 || lambdaMinRatio >= 1.0)) {
        throw DepInfer::ConfigurationException("lambda_min_ratio must be -1 or within (0,1)");
    }
    if (lambdaRule != "min" && lambdaRule != "1se") {
        throw DepInfer::ConfigurationException("lambda_rule must be one of: min, 1se");
    }
    if (!(tolerance > 0.0)) {
        throw DepInfer::ConfigurationException("tolerance must be > 0");
    }
    if (maxIterations < 1) {
        throw DepInfer::ConfigurationException("max_iterations must be >= 1");
    }
    if (delimiter == '"' || delimiter == '\n' || delimiter == '\r') {
        throw DepInfer::ConfigurationException("delimiter cannot be a quote or line break");
    }

    std::unordered_set<std::string> seen;
    for (const auto& id : keep) {
        if (!seen.insert(id).second) {
            throw DepInfer::ConfigurationException("keep lists '" + id + "' more than once");
        }
    }
}

void PipelineConfig::requireInputs() const {
    if (affinityPath.empty() || responsePath.empty()) {
        throw DepInfer::ConfigurationException("both --affinity and --response are required\n" + usage());
    }
}

ReductionOptions PipelineConfig::reductionOptions() const {
    ReductionOptions options;
    options.transform = transform;
    options.dedupe = dedupe;
    options.keep = keep;
    options.cutoff = cutoff;
    options.verbose = verbose;
    return options;
}

EnsembleOptions PipelineConfig::ensembleOptions() const {
    EnsembleOptions options;
    options.repeats = repeats;
    options.seed = seed;
    options.verbose = verbose;
    options.solver.folds = folds;
    options.solver.rule = (lambdaRule == "1se") ? LambdaRule::ONE_SE : LambdaRule::MIN;
    options.solver.standardize = standardize;
    options.solver.nLambda = nLambda;
    options.solver.lambdaMinRatio = lambdaMinRatio;
    options.solver.tolerance = tolerance;
    options.solver.maxIterations = maxIterations;
    return options;
}
