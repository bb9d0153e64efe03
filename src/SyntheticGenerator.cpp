#include "SyntheticGenerator.h"

#include "CommonUtils.h"
#include "GeometraExceptions.h"

#include <cmath>
#include <unordered_map>
#include <vector>

Dataset SyntheticGenerator::generate(const SyntheticOptions& options, std::mt19937& rng) {
    if (options.categories == 0 || options.subjects == 0 || options.runs == 0 ||
        options.repetitions == 0 || options.features == 0) {
        throw Geometra::ConfigurationException("synthetic dataset counts must all be > 0");
    }
    if (!std::isfinite(options.noiseSigma) || options.noiseSigma < 0.0) {
        throw Geometra::ConfigurationException("noise sigma must be finite and >= 0");
    }

    Dataset dataset(options.features, options.categories);
    std::normal_distribution<double> unit(0.0, 1.0);

    for (size_t subject = 0; subject < options.subjects; ++subject) {
        std::vector<std::vector<double>> signal(options.categories, std::vector<double>(options.features, 0.0));
        for (auto& pattern : signal) {
            for (double& v : pattern) v = unit(rng);
        }

        for (size_t run = 0; run < options.runs; ++run) {
            for (size_t rep = 0; rep < options.repetitions; ++rep) {
                for (size_t target = 0; target < options.categories; ++target) {
                    std::vector<double> row(options.features, 0.0);
                    for (size_t f = 0; f < options.features; ++f) {
                        row[f] = signal[target][f] + options.noiseSigma * unit(rng);
                    }
                    dataset.addObservation(std::move(row),
                                           static_cast<int>(target + 1),
                                           static_cast<int>(run + 1),
                                           static_cast<int>(subject + 1));
                }
            }
        }
    }
    return dataset;
}

size_t SyntheticGenerator::featuresForPreset(const std::string& preset) {
    static const std::unordered_map<std::string, size_t> presets = {
        {"tiny", 2},
        {"small", 6},
        {"normal", 30},
        {"big", 6460}
    };
    auto it = presets.find(CommonUtils::toLower(CommonUtils::trim(preset)));
    if (it == presets.end()) {
        throw Geometra::ConfigurationException("size must be one of: tiny, small, normal, big (got '" + preset + "')");
    }
    return it->second;
}
