#include "ClusterInjector.h"

#include "CommonUtils.h"
#include "GeometraExceptions.h"
#include "Statistics.h"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace {
std::string clusterName(const ClusterSpec& spec) {
    return spec.description.empty() ? std::string("<unnamed>") : spec.description;
}
} // namespace

void ClusterInjector::validateTargets(const ClusterSpec& spec, size_t categoryCount) {
    const std::string name = clusterName(spec);
    if (spec.targets.empty()) {
        throw Geometra::InvalidClusterSpecException("cluster '" + name + "' has an empty target set");
    }
    for (int target : spec.targets) {
        if (target < 1 || static_cast<size_t>(target) > categoryCount) {
            throw Geometra::InvalidClusterSpecException("cluster '" + name + "' references target " +
                                                        std::to_string(target) + " outside [1, " +
                                                        std::to_string(categoryCount) + "]");
        }
    }
}

void ClusterInjector::validateSpec(const ClusterSpec& spec, size_t categoryCount) {
    validateTargets(spec, categoryCount);
    const std::string name = clusterName(spec);
    if (!std::isfinite(spec.sigmaLevel) || spec.sigmaLevel < 0.0 || spec.sigmaLevel > 1.0) {
        throw Geometra::InvalidClusterSpecException("cluster '" + name + "' sigma level must be within [0, 1]");
    }
}

InjectionRecord ClusterInjector::apply(Dataset& dataset, const ClusterSpec& spec, std::mt19937& rng) {
    validateSpec(spec, dataset.categoryCount());

    const std::vector<size_t> rows = dataset.indicesForTargets(spec.targets);
    if (rows.empty()) {
        throw Geometra::InvalidClusterSpecException("no observations found for targets [" +
                                                    CommonUtils::joinTargets(spec.targets) + "]");
    }

    InjectionRecord record;
    record.affectedObservations = rows.size();
    if (spec.sigmaLevel == 0.0) return record;

    const double sigma = spec.sigmaLevel;
    const size_t featureCount = dataset.featureCount();
    const size_t toModify = static_cast<size_t>(std::lround(sigma * static_cast<double>(featureCount)));

    std::vector<size_t> order(featureCount);
    std::iota(order.begin(), order.end(), 0);
    std::shuffle(order.begin(), order.end(), rng);
    record.selectedFeatures.assign(order.begin(), order.begin() + static_cast<std::ptrdiff_t>(toModify));

    // Pattern scale follows the current data so injected structure sits on the noise scale.
    const double magnitude = Statistics::calculateMatrixStats(dataset.samples()).stddev;
    std::normal_distribution<double> unit(0.0, 1.0);
    std::vector<double> drawn(featureCount, 0.0);
    for (double& v : drawn) v = unit(rng) * magnitude;

    record.pattern.assign(featureCount, 0.0);
    for (size_t f : record.selectedFeatures) record.pattern[f] = drawn[f];

    auto& samples = dataset.mutableSamples();
    for (size_t row : rows) {
        auto& values = samples[row];
        for (size_t f = 0; f < featureCount; ++f) {
            values[f] = (1.0 - sigma) * values[f] + sigma * record.pattern[f];
        }
    }
    record.applied = true;
    return record;
}
