#pragma once
#include "ClusterInjector.h"
#include "Dataset.h"
#include <random>
#include <string>
#include <vector>

// One hypothesis about representational organization. Specs are applied in list order.
struct ClusteringScheme {
    std::string description;
    std::vector<ClusterSpec> clusters;
};

struct ClusteredDatasetResult {
    Dataset dataset;
    std::vector<ClusterSpec> appliedClusters;
    std::vector<InjectionRecord> injections;
};

class ClusteredDatasetBuilder {
public:
    /**
     * @brief Threads `base` through ClusterInjector once per spec, then labels every row.
     *
     * Later, narrower specs partially overwrite what broader ones injected, so the
     * scheme order is part of the model and is never rearranged.
     * @throws Geometra::InvalidClusterSpecException from any injection step.
     * @throws Geometra::UnknownTargetIdException when labelMap misses a target.
     */
    static ClusteredDatasetResult build(Dataset base,
                                        const ClusteringScheme& scheme,
                                        const TargetLabelMap& labelMap,
                                        std::mt19937& rng);
};
