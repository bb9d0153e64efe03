#pragma once
#include "Dataset.h"
#include "Rdm.h"
#include <string>
#include <vector>

enum class DistanceMetric { CORRELATION, EUCLIDEAN, COSINE };

struct RdmOptions {
    DistanceMetric metric = DistanceMetric::CORRELATION;
    // Subtract each feature's mean across categories before measuring distance.
    bool centerData = true;
};

struct ObservedRdm {
    RdmMatrix matrix;
    std::vector<std::string> labels; // row/column order, target 1..C
};

class ObservedRdmBuilder {
public:
    /**
     * @brief Per-category mean feature vectors, row t-1 for target t.
     * @throws Geometra::EmptyCategoryException naming the first target without observations.
     */
    static std::vector<std::vector<double>> categoryMeans(const Dataset& dataset);

    /**
     * @brief Symmetric C x C dissimilarity between category means with a zero diagonal.
     * @throws Geometra::EmptyCategoryException when a category has no observations.
     * @throws Geometra::DatasetException when correlation/cosine distance is undefined
     *         for a constant or all-zero category pattern.
     */
    static ObservedRdm build(const Dataset& dataset, const RdmOptions& options = RdmOptions());

    /**
     * @brief Distance between two equally sized patterns.
     * @throws Geometra::DatasetException when the metric is undefined for the inputs.
     */
    static double distance(const std::vector<double>& a, const std::vector<double>& b, DistanceMetric metric);

    static DistanceMetric parseMetric(const std::string& name);
    static std::string metricName(DistanceMetric metric);
};
