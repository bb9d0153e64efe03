#include "AnalysisConfig.h"
#include "CommonUtils.h"
#include "GeometraExceptions.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace {
template <typename T, typename Parser>
T parseNumericStrict(const std::string& value, const std::string& key, const std::string& errorPrefix, Parser parser) {
    try {
        size_t pos = 0;
        T parsed = parser(value, &pos);
        if (pos != value.size()) {
            throw Geometra::ConfigurationException(errorPrefix + key + ": " + value);
        }
        return parsed;
    } catch (const Geometra::GeometraException&) {
        throw;
    } catch (const std::exception& ex) {
        throw Geometra::ConfigurationException(errorPrefix + key + ": " + value + " (" + ex.what() + ")");
    }
}

size_t parseSizeStrict(const std::string& value, const std::string& key, size_t minValue) {
    if (!value.empty() && value[0] == '-') {
        throw Geometra::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    const unsigned long long parsed = parseNumericStrict<unsigned long long>(
        value, key, "Invalid integer for ",
        [](const std::string& v, size_t* pos) { return std::stoull(v, pos); });
    if (parsed < minValue) {
        throw Geometra::ConfigurationException("Value for " + key + " must be >= " + std::to_string(minValue));
    }
    return static_cast<size_t>(parsed);
}

double parseDoubleStrict(const std::string& value, const std::string& key, double minValue) {
    const double parsed = parseNumericStrict<double>(
        value, key, "Invalid number for ",
        [](const std::string& v, size_t* pos) { return std::stod(v, pos); });
    if (!std::isfinite(parsed)) throw Geometra::ConfigurationException("Value for " + key + " must be finite");
    if (parsed < minValue) {
        std::ostringstream os;
        os << "Value for " << key << " must be >= " << minValue;
        throw Geometra::ConfigurationException(os.str());
    }
    return parsed;
}

uint32_t parseSeedStrict(const std::string& value, const std::string& key) {
    const size_t parsed = parseSizeStrict(value, key, 0);
    if (parsed > std::numeric_limits<uint32_t>::max()) {
        throw Geometra::ConfigurationException("Value for " + key + " exceeds the 32-bit seed range");
    }
    return static_cast<uint32_t>(parsed);
}

bool parseBoolStrict(const std::string& value, const std::string& key) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(value));
    if (lowered == "true" || lowered == "yes" || lowered == "1" || lowered == "on") return true;
    if (lowered == "false" || lowered == "no" || lowered == "0" || lowered == "off") return false;
    throw Geometra::ConfigurationException("Invalid boolean for " + key + ": " + value + " (expected true/false)");
}

std::string maybeUnquote(std::string value) {
    value = CommonUtils::trim(value);
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

std::string normalizeConfigKey(std::string key) {
    std::string out = CommonUtils::toLower(CommonUtils::trim(key));
    std::replace(out.begin(), out.end(), '-', '_');
    return out;
}

void assignKeyValue(AnalysisConfig& config, const std::string& key, const std::string& value) {
    struct SizeRule {
        size_t AnalysisConfig::*member;
        size_t minValue;
    };
    struct DoubleRule {
        double AnalysisConfig::*member;
        double minValue;
    };

    static const std::unordered_map<std::string, std::string AnalysisConfig::*> lowerStringFields = {
        {"roi", &AnalysisConfig::roi},
        {"size", &AnalysisConfig::size},
        {"metric", &AnalysisConfig::metric},
        {"regression", &AnalysisConfig::regression}
    };
    static const std::unordered_map<std::string, bool AnalysisConfig::*> boolFields = {
        {"center_data", &AnalysisConfig::centerData},
        {"standardize", &AnalysisConfig::standardize},
        {"decoding", &AnalysisConfig::decoding},
        {"verbose", &AnalysisConfig::verbose}
    };
    static const std::unordered_map<std::string, SizeRule> sizeFields = {
        {"categories", {&AnalysisConfig::categories, 2}},
        {"subjects", {&AnalysisConfig::subjects, 1}},
        {"runs", {&AnalysisConfig::runs, 1}},
        {"repetitions", {&AnalysisConfig::repetitions, 1}}
    };
    static const std::unordered_map<std::string, DoubleRule> doubleFields = {
        {"noise_sigma", {&AnalysisConfig::noiseSigma, 0.0}},
        {"lda_regularization", {&AnalysisConfig::ldaRegularization, 0.0}}
    };

    if (key == "seed") {
        config.seed = parseSeedStrict(value, key);
        return;
    }
    if (auto it = lowerStringFields.find(key); it != lowerStringFields.end()) {
        config.*(it->second) = CommonUtils::toLower(CommonUtils::trim(value));
        return;
    }
    if (auto it = boolFields.find(key); it != boolFields.end()) {
        config.*(it->second) = parseBoolStrict(value, key);
        return;
    }
    if (auto it = sizeFields.find(key); it != sizeFields.end()) {
        config.*(it->second.member) = parseSizeStrict(value, key, it->second.minValue);
        return;
    }
    if (auto it = doubleFields.find(key); it != doubleFields.end()) {
        config.*(it->second.member) = parseDoubleStrict(value, key, it->second.minValue);
        return;
    }
    throw Geometra::ConfigurationException("Unknown config key: " + key);
}
} // namespace

AnalysisConfig AnalysisConfig::fromFile(const std::string& configPath, const AnalysisConfig& base) {
    std::ifstream in(configPath);
    if (!in) throw Geometra::IOException("Could not open config file: " + configPath);

    AnalysisConfig config = base;
    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = CommonUtils::trim(line);
        if (line.empty() || line[0] == '#') continue;

        const size_t sep = line.find(':');
        if (sep == std::string::npos) {
            throw Geometra::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                   ": expected 'key: value' but got '" + line + "'");
        }
        const std::string key = normalizeConfigKey(maybeUnquote(line.substr(0, sep)));
        const std::string value = maybeUnquote(line.substr(sep + 1));

        try {
            assignKeyValue(config, key, value);
        } catch (const Geometra::GeometraException& ex) {
            throw Geometra::ConfigurationException("Config parse error at line " + std::to_string(lineNo) +
                                                   ": '" + line + "' -> " + ex.what());
        }
    }
    config.validate();
    return config;
}

AnalysisConfig AnalysisConfig::fromArgs(int argc, char* argv[]) {
    AnalysisConfig config;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            config.showHelp = true;
            return config;
        }
    }

    // The config file is the base layer, so locate it before applying any flag.
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            if (i + 1 >= argc) throw Geometra::ConfigurationException("--config expects a file path");
            config = fromFile(argv[i + 1], config);
            break;
        }
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--verbose") {
            config.verbose = true;
            continue;
        }
        if (arg == "--config") {
            ++i;
            continue;
        }
        if (arg.rfind("--", 0) != 0 || i + 1 >= argc) {
            throw Geometra::ConfigurationException("Unknown or incomplete argument: " + arg);
        }
        const std::string key = normalizeConfigKey(arg.substr(2));
        assignKeyValue(config, key, argv[++i]);
    }

    config.validate();
    return config;
}

void AnalysisConfig::validate() const {
    const auto isIn = [](const std::string& value, const std::vector<std::string>& allowed) {
        return std::find(allowed.begin(), allowed.end(), CommonUtils::toLower(value)) != allowed.end();
    };

    if (!isIn(roi, {"it", "v1", "none"})) {
        throw Geometra::ConfigurationException("roi must be one of: IT, V1, none");
    }
    if (!isIn(size, {"tiny", "small", "normal", "big"})) {
        throw Geometra::ConfigurationException("size must be one of: tiny, small, normal, big");
    }
    if (!isIn(metric, {"correlation", "euclidean", "cosine"})) {
        throw Geometra::ConfigurationException("metric must be one of: correlation, euclidean, cosine");
    }
    if (!isIn(regression, {"ordinary", "ols", "rank", "spearman"})) {
        throw Geometra::ConfigurationException("regression must be one of: ordinary, rank");
    }
    if (categories < 2) {
        throw Geometra::ConfigurationException("categories must be >= 2");
    }
    if (subjects == 0 || runs == 0 || repetitions == 0) {
        throw Geometra::ConfigurationException("subjects, runs and repetitions must be > 0");
    }
    if (!std::isfinite(noiseSigma) || noiseSigma < 0.0) {
        throw Geometra::ConfigurationException("noise_sigma must be finite and >= 0");
    }
    if (!std::isfinite(ldaRegularization) || ldaRegularization < 0.0) {
        throw Geometra::ConfigurationException("lda_regularization must be finite and >= 0");
    }
    if (decoding && runs < 2) {
        throw Geometra::ConfigurationException("decoding needs runs >= 2 (or set decoding: false)");
    }
    // LDA inverts a features x features covariance per fold.
    if (decoding && CommonUtils::toLower(size) == "big") {
        throw Geometra::ConfigurationException("decoding is limited to sizes tiny, small and normal (set decoding: false for big)");
    }
}

std::string AnalysisConfig::usage(const std::string& program) {
    std::ostringstream os;
    os << "Usage: " << program << " [options]\n"
       << "Options:\n"
       << "  --config <file>                  key: value file applied before the flags below\n"
       << "  --roi <IT|V1|none>               Simulated region and its clustering scheme (default: IT)\n"
       << "  --categories <n>                 Number of conditions (default: 8)\n"
       << "  --subjects <n>                   Number of subjects (default: 1)\n"
       << "  --runs <n>                       Number of runs / chunks (default: 10)\n"
       << "  --repetitions <n>                Repetitions per condition and run (default: 1)\n"
       << "  --noise-sigma <val>              Baseline noise standard deviation (default: 0.6)\n"
       << "  --seed <n>                       Random seed (default: 42)\n"
       << "  --size <tiny|small|normal|big>   Feature count preset (default: normal)\n"
       << "  --metric <correlation|euclidean|cosine>  Observed RDM distance (default: correlation)\n"
       << "  --center-data <true|false>       Center condition means before the RDM (default: true)\n"
       << "  --regression <ordinary|rank>     RSA regression flavour (default: ordinary)\n"
       << "  --standardize <true|false>       z-score RDM vectors before regression (default: true)\n"
       << "  --decoding <true|false>          Run leave-one-run-out LDA decoding (default: true)\n"
       << "  --lda-regularization <val>       LDA covariance ridge (default: 0.01)\n"
       << "  --verbose                        Print per-step diagnostics\n"
       << "  --help                           Show this help message\n";
    return os.str();
}
