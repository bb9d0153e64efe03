#pragma once
#include "Dataset.h"
#include <cstddef>
#include <random>
#include <string>
#include <vector>

struct ClusterSpec {
    std::vector<int> targets;
    double sigmaLevel = 0.0; // [0, 1]; share of features overwritten and blend weight
    std::string description;
};

struct InjectionRecord {
    std::vector<size_t> selectedFeatures;
    std::vector<double> pattern; // zero outside selectedFeatures
    size_t affectedObservations = 0;
    bool applied = false;
};

class ClusterInjector {
public:
    /**
     * @brief Pulls every observation whose target is in spec.targets toward one shared random pattern.
     *
     * round(sigma * F) features are picked by a random permutation; the pattern is
     * N(0, s^2) with s the standard deviation of the whole current sample matrix,
     * zeroed outside the picked features. Affected rows become
     * (1 - sigma) * row + sigma * pattern. sigma == 0 leaves the dataset and rng untouched.
     * @throws Geometra::InvalidClusterSpecException on empty/out-of-range targets,
     *         sigma outside [0, 1], or when no observation matches.
     */
    static InjectionRecord apply(Dataset& dataset, const ClusterSpec& spec, std::mt19937& rng);

    /**
     * @brief Checks targets and sigma against a category count without touching data.
     * @throws Geometra::InvalidClusterSpecException
     */
    static void validateSpec(const ClusterSpec& spec, size_t categoryCount);

    // Target set only: non-empty and every id within [1, categoryCount].
    static void validateTargets(const ClusterSpec& spec, size_t categoryCount);
};
