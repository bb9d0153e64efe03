#pragma once
#include <cstdint>
#include <string>

struct AnalysisConfig {
    // Simulation
    std::string roi = "IT";              // IT|V1|none
    size_t categories = 8;
    size_t subjects = 1;
    size_t runs = 10;
    size_t repetitions = 1;
    double noiseSigma = 0.6;
    uint32_t seed = 42;
    std::string size = "normal";         // tiny|small|normal|big

    // Observed RDM
    std::string metric = "correlation";  // correlation|euclidean|cosine
    bool centerData = true;

    // RSA regression
    std::string regression = "ordinary"; // ordinary|rank
    bool standardize = true;

    // Decoding
    bool decoding = true;
    double ldaRegularization = 0.01;

    bool verbose = false;
    bool showHelp = false;

    /**
     * @brief Builds config from CLI flags and an optional --config file.
     * @post Returns a validated config object; file values are applied first, flags override them.
     * @throws Geometra::ConfigurationException on unknown flags or invalid values.
     */
    static AnalysisConfig fromArgs(int argc, char* argv[]);

    /**
     * @brief Loads `key: value` lines (# comments, optional quotes) on top of `base`.
     * @throws Geometra::IOException when the file cannot be opened.
     * @throws Geometra::ConfigurationException naming the line on parse or validation failures.
     */
    static AnalysisConfig fromFile(const std::string& configPath, const AnalysisConfig& base);

    /**
     * @brief Validates ranges and enum-like fields.
     * @throws Geometra::ConfigurationException on invalid values.
     */
    void validate() const;

    static std::string usage(const std::string& program);
};
