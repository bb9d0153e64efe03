#include "ClusteredDatasetBuilder.h"

#include <utility>

ClusteredDatasetResult ClusteredDatasetBuilder::build(Dataset base,
                                                      const ClusteringScheme& scheme,
                                                      const TargetLabelMap& labelMap,
                                                      std::mt19937& rng) {
    ClusteredDatasetResult result{std::move(base), {}, {}};
    result.appliedClusters.reserve(scheme.clusters.size());
    result.injections.reserve(scheme.clusters.size());

    for (const ClusterSpec& spec : scheme.clusters) {
        result.injections.push_back(ClusterInjector::apply(result.dataset, spec, rng));
        result.appliedClusters.push_back(spec);
    }

    result.dataset.attachLabels(labelMap);
    return result;
}
