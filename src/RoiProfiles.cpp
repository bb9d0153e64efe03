#include "RoiProfiles.h"

#include "CommonUtils.h"
#include "GeometraExceptions.h"

RoiProfile RoiProfiles::parse(const std::string& value) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(value));
    if (lowered == "it") return RoiProfile::IT;
    if (lowered == "v1") return RoiProfile::V1;
    if (lowered == "none") return RoiProfile::NONE;
    throw Geometra::ConfigurationException("roi must be one of: IT, V1, none (got '" + value + "')");
}

std::string RoiProfiles::name(RoiProfile roi) {
    switch (roi) {
        case RoiProfile::IT: return "IT";
        case RoiProfile::V1: return "V1";
        case RoiProfile::NONE: return "none";
    }
    return "unknown";
}

ClusteringScheme RoiProfiles::clusteringScheme(RoiProfile roi) {
    switch (roi) {
        case RoiProfile::IT:
            return {"IT categorical geometry", {
                {{1, 2, 3, 4}, 0.7, "Animate"},
                {{1, 2}, 0.2, "Humans"},
                {{3, 4}, 0.2, "Animals"},
                {{5, 6}, 0.7, "Natural"},
                {{7, 8}, 0.6, "Artificial"}
            }};
        case RoiProfile::V1:
            return {"V1 perceptual geometry", {
                {{1, 3, 5, 7}, 0.4, "Round"},
                {{2, 4, 6, 8}, 0.4, "Spiky"}
            }};
        case RoiProfile::NONE:
            break;
    }
    return {"No injected structure", {}};
}

std::vector<ClusteringScheme> RoiProfiles::defaultModelSchemes() {
    return {
        {"Animate vs. Inanimate", {
            {{1, 2, 3, 4}, 0.0, "Animate"},
            {{5, 6, 7, 8}, 0.0, "Inanimate"}
        }},
        {"Grouped Pairs", {
            {{1, 2}, 0.0, "Humans"},
            {{3, 4}, 0.0, "Animals"},
            {{5, 6}, 0.0, "Natural Objects"},
            {{7, 8}, 0.0, "Artificial Objects"}
        }},
        {"Round vs. Spiky", {
            {{2, 4, 6, 8}, 0.0, "Even Categories"},
            {{1, 3, 5, 7}, 0.0, "Odd Categories"}
        }}
    };
}

const TargetLabelMap& RoiProfiles::defaultTargetLabels() {
    static const TargetLabelMap labels = {
        {1, "human face"},
        {2, "human body"},
        {3, "animal face"},
        {4, "animal body"},
        {5, "natural round"},
        {6, "natural spiky"},
        {7, "artificial round"},
        {8, "artificial spiky"}
    };
    return labels;
}
