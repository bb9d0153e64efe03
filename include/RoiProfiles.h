#pragma once
#include "ClusteredDatasetBuilder.h"
#include "Dataset.h"
#include <string>
#include <vector>

// Simulated region of interest; each carries its own assumed representational geometry.
enum class RoiProfile { IT, V1, NONE };

namespace RoiProfiles {
/**
 * @brief Parses "it", "v1" or "none" (case-insensitive).
 * @throws Geometra::ConfigurationException for anything else.
 */
RoiProfile parse(const std::string& name);
std::string name(RoiProfile roi);

/**
 * IT: animate/inanimate with nested humans/animals and natural/artificial groups.
 * V1: round vs spiky shape similarity. NONE: no injected structure.
 */
ClusteringScheme clusteringScheme(RoiProfile roi);

// Hypothesis set regressed against every ROI: animate/inanimate, grouped pairs, round/spiky.
std::vector<ClusteringScheme> defaultModelSchemes();

// 1 human face ... 8 artificial spiky.
const TargetLabelMap& defaultTargetLabels();
}
