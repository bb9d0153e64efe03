#include "ModelRdmGenerator.h"

ModelRdm ModelRdmGenerator::generate(size_t categoryCount, const ClusteringScheme& scheme) {
    ModelRdm model;
    model.description = scheme.description;
    model.clusters = scheme.clusters;
    model.matrix = RdmUtils::filled(categoryCount, kDifferentCluster);

    for (const ClusterSpec& spec : scheme.clusters) {
        ClusterInjector::validateTargets(spec, categoryCount);
        for (int a : spec.targets) {
            for (int b : spec.targets) {
                model.matrix[static_cast<size_t>(a - 1)][static_cast<size_t>(b - 1)] = kSameCluster;
            }
        }
    }

    // Categories outside every spec would otherwise keep a 2 on the diagonal.
    for (size_t i = 0; i < categoryCount; ++i) model.matrix[i][i] = kSameCluster;
    return model;
}

std::vector<ModelRdm> ModelRdmGenerator::generateAll(size_t categoryCount, const std::vector<ClusteringScheme>& schemes) {
    std::vector<ModelRdm> models;
    models.reserve(schemes.size());
    for (const ClusteringScheme& scheme : schemes) {
        models.push_back(generate(categoryCount, scheme));
    }
    return models;
}
