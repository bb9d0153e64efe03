#pragma once
#include "ClusteredDatasetBuilder.h"
#include "Rdm.h"
#include <string>
#include <vector>

struct ModelRdm {
    std::string description;
    RdmMatrix matrix;
    std::vector<ClusterSpec> clusters;
};

class ModelRdmGenerator {
public:
    static constexpr double kSameCluster = 0.0;
    static constexpr double kDifferentCluster = 2.0;

    /**
     * @brief Idealized 0/2 dissimilarity matrix for one scheme.
     *
     * Starts from all 2s and zeroes every (i, j) with both targets inside one
     * spec; the diagonal is zeroed explicitly as well. Strengths are ignored and
     * pairs never covered by a spec stay at 2.
     * @throws Geometra::InvalidClusterSpecException on empty or out-of-range target sets.
     */
    static ModelRdm generate(size_t categoryCount, const ClusteringScheme& scheme);

    // One ModelRdm per scheme, same order.
    static std::vector<ModelRdm> generateAll(size_t categoryCount, const std::vector<ClusteringScheme>& schemes);
};
