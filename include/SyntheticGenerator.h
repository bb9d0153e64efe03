#pragma once
#include "Dataset.h"
#include <cstddef>
#include <random>
#include <string>

struct SyntheticOptions {
    size_t categories = 8;
    size_t subjects = 1;
    size_t runs = 10;
    size_t repetitions = 1;
    size_t features = 30;
    double noiseSigma = 0.6;
};

class SyntheticGenerator {
public:
    /**
     * @brief Builds a base dataset with independent per-condition signal plus Gaussian noise.
     *
     * Rows are ordered subject, run, repetition, target. Each (subject, target)
     * owns a N(0,1) signal pattern shared across its runs; every row adds
     * N(0, noiseSigma^2) noise on top.
     * @throws Geometra::ConfigurationException on zero counts or negative noise.
     */
    static Dataset generate(const SyntheticOptions& options, std::mt19937& rng);

    /**
     * @brief Feature count for a named size preset: tiny, small, normal, big.
     * @throws Geometra::ConfigurationException for unknown presets.
     */
    static size_t featuresForPreset(const std::string& preset);
};
