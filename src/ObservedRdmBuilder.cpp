#include "ObservedRdmBuilder.h"

#include "CommonUtils.h"
#include "GeometraExceptions.h"
#include "MathUtils.h"

#include <cmath>
#ifdef USE_OPENMP
#include <omp.h>
#endif

std::vector<std::vector<double>> ObservedRdmBuilder::categoryMeans(const Dataset& dataset) {
    const size_t categories = dataset.categoryCount();
    const size_t features = dataset.featureCount();
    std::vector<std::vector<double>> means(categories, std::vector<double>(features, 0.0));
    std::vector<size_t> counts(categories, 0);

    const auto& samples = dataset.samples();
    const auto& targets = dataset.targets();
    for (size_t i = 0; i < samples.size(); ++i) {
        const size_t t = static_cast<size_t>(targets[i] - 1);
        for (size_t f = 0; f < features; ++f) means[t][f] += samples[i][f];
        ++counts[t];
    }

    for (size_t t = 0; t < categories; ++t) {
        if (counts[t] == 0) {
            throw Geometra::EmptyCategoryException(static_cast<int>(t + 1), "observed RDM construction");
        }
        for (double& v : means[t]) v /= static_cast<double>(counts[t]);
    }
    return means;
}

double ObservedRdmBuilder::distance(const std::vector<double>& a, const std::vector<double>& b, DistanceMetric metric) {
    if (a.size() != b.size()) {
        throw Geometra::DimensionMismatchException("patterns of length " + std::to_string(a.size()) +
                                                   " and " + std::to_string(b.size()));
    }
    switch (metric) {
        case DistanceMetric::CORRELATION: {
            auto r = MathUtils::calculatePearson(a, b);
            if (!r) throw Geometra::DatasetException("correlation distance undefined for a constant condition pattern");
            return 1.0 - *r;
        }
        case DistanceMetric::EUCLIDEAN: {
            double sum = 0.0;
            for (size_t i = 0; i < a.size(); ++i) {
                const double d = a[i] - b[i];
                sum += d * d;
            }
            return std::sqrt(sum);
        }
        case DistanceMetric::COSINE: {
            double dot = 0.0;
            double na = 0.0;
            double nb = 0.0;
            for (size_t i = 0; i < a.size(); ++i) {
                dot += a[i] * b[i];
                na += a[i] * a[i];
                nb += b[i] * b[i];
            }
            if (na <= MathUtils::getNumericEpsilon() || nb <= MathUtils::getNumericEpsilon()) {
                throw Geometra::DatasetException("cosine distance undefined for an all-zero condition pattern");
            }
            return 1.0 - dot / std::sqrt(na * nb);
        }
    }
    return 0.0;
}

ObservedRdm ObservedRdmBuilder::build(const Dataset& dataset, const RdmOptions& options) {
    std::vector<std::vector<double>> means = categoryMeans(dataset);
    const size_t n = means.size();

    if (options.centerData && n > 0) {
        const size_t features = dataset.featureCount();
        for (size_t f = 0; f < features; ++f) {
            double mu = 0.0;
            for (const auto& row : means) mu += row[f];
            mu /= static_cast<double>(n);
            for (auto& row : means) row[f] -= mu;
        }
    }

    ObservedRdm rdm;
    rdm.matrix = RdmUtils::filled(n, 0.0);
    rdm.labels.reserve(n);
    for (size_t t = 0; t < n; ++t) rdm.labels.push_back(dataset.labelForTarget(static_cast<int>(t + 1)));

    // Pairs are independent; exceptions must not escape an OpenMP region, so collect the first failure.
    std::string failure;
    #ifdef USE_OPENMP
    #pragma omp parallel for schedule(dynamic)
    #endif
    for (long long i = 0; i < static_cast<long long>(n); ++i) {
        const size_t row = static_cast<size_t>(i);
        for (size_t j = row + 1; j < n; ++j) {
            try {
                const double d = distance(means[row], means[j], options.metric);
                rdm.matrix[row][j] = d;
                rdm.matrix[j][row] = d;
            } catch (const Geometra::GeometraException& ex) {
                #ifdef USE_OPENMP
                #pragma omp critical(geometra_rdm_failure)
                #endif
                {
                    if (failure.empty()) {
                        failure = "targets " + std::to_string(row + 1) + " and " + std::to_string(j + 1) + ": " + ex.what();
                    }
                }
            }
        }
    }
    if (!failure.empty()) throw Geometra::DatasetException(failure);
    return rdm;
}

DistanceMetric ObservedRdmBuilder::parseMetric(const std::string& name) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(name));
    if (lowered == "correlation") return DistanceMetric::CORRELATION;
    if (lowered == "euclidean") return DistanceMetric::EUCLIDEAN;
    if (lowered == "cosine") return DistanceMetric::COSINE;
    throw Geometra::ConfigurationException("metric must be one of: correlation, euclidean, cosine (got '" + name + "')");
}

std::string ObservedRdmBuilder::metricName(DistanceMetric metric) {
    switch (metric) {
        case DistanceMetric::CORRELATION: return "correlation";
        case DistanceMetric::EUCLIDEAN: return "euclidean";
        case DistanceMetric::COSINE: return "cosine";
    }
    return "unknown";
}
