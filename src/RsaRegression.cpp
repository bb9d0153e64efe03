#include "RsaRegression.h"

#include "CommonUtils.h"
#include "GeometraExceptions.h"
#include "MathUtils.h"
#include "Statistics.h"

#include <iostream>

namespace {
std::string shapeOf(const RdmMatrix& matrix) {
    const size_t cols = matrix.empty() ? 0 : matrix.front().size();
    return std::to_string(matrix.size()) + "x" + std::to_string(cols);
}

bool isConstant(const std::vector<double>& values) {
    const ColumnStats stats = Statistics::calculateStats(values);
    return stats.count < 2 || stats.variance <= 1e-24;
}

std::vector<double> prepareVector(std::vector<double> values, const RsaRegressionOptions& options) {
    if (options.mode == RegressionMode::RANK) values = Statistics::averageRanks(values);
    if (options.standardize) values = Statistics::zScore(values);
    return values;
}
} // namespace

RsaRegressionResult RsaRegression::fit(const ObservedRdm& observed,
                                       const std::vector<ModelRdm>& models,
                                       const RsaRegressionOptions& options) {
    const size_t n = observed.matrix.size();
    if (!RdmUtils::isSquare(observed.matrix)) {
        throw Geometra::DimensionMismatchException("observed RDM is " + shapeOf(observed.matrix) + ", expected a square matrix");
    }
    if (models.empty()) throw Geometra::RegressionException("at least one model RDM is required");
    for (const ModelRdm& model : models) {
        if (model.matrix.size() != n || !RdmUtils::isSquare(model.matrix)) {
            throw Geometra::DimensionMismatchException("model '" + model.description + "' is " + shapeOf(model.matrix) +
                                                       " but the observed RDM is " + shapeOf(observed.matrix));
        }
    }

    RsaRegressionResult result;
    result.coefficients.assign(models.size(), 0.0);
    result.tStats.assign(models.size(), 0.0);
    result.pValues.assign(models.size(), 1.0);
    for (const ModelRdm& model : models) result.descriptions.push_back(model.description);

    const std::vector<double> rawResponse = RdmUtils::upperTriangle(observed.matrix);
    result.pairCount = rawResponse.size();
    if (isConstant(rawResponse)) {
        throw Geometra::RegressionException("observed RDM has no variance across " +
                                            std::to_string(rawResponse.size()) + " condition pairs");
    }
    const std::vector<double> response = prepareVector(rawResponse, options);

    std::vector<size_t> kept;
    std::vector<std::vector<double>> regressors;
    for (size_t m = 0; m < models.size(); ++m) {
        const std::vector<double> raw = RdmUtils::upperTriangle(models[m].matrix);
        if (isConstant(raw)) {
            result.droppedModels.push_back(models[m].description);
            result.droppedModelIndices.push_back(m);
            std::cerr << "[Geometra Warning] Model '" << models[m].description
                      << "' predicts a constant RDM and is excluded from the regression.\n";
            continue;
        }
        kept.push_back(m);
        regressors.push_back(prepareVector(raw, options));
    }
    if (kept.empty()) throw Geometra::RegressionException("every model RDM is constant");

    const size_t pairs = response.size();
    if (pairs <= kept.size() + 1) {
        throw Geometra::RegressionException(std::to_string(pairs) + " condition pairs cannot support " +
                                            std::to_string(kept.size()) + " models plus an intercept");
    }

    MathUtils::Matrix X(pairs, kept.size() + 1);
    MathUtils::Matrix Y(pairs, 1);
    for (size_t i = 0; i < pairs; ++i) {
        X.at(i, 0) = 1.0;
        for (size_t k = 0; k < kept.size(); ++k) X.at(i, k + 1) = regressors[k][i];
        Y.at(i, 0) = response[i];
    }

    const MLRDiagnostics diag = MathUtils::performMLRWithDiagnostics(X, Y);
    if (!diag.success) {
        throw Geometra::RegressionException("model RDMs are collinear; the regression has no unique solution");
    }

    result.intercept = diag.coefficients[0];
    for (size_t k = 0; k < kept.size(); ++k) {
        result.coefficients[kept[k]] = diag.coefficients[k + 1];
        result.tStats[kept[k]] = diag.tStats[k + 1];
        result.pValues[kept[k]] = diag.pValues[k + 1];
    }
    result.rSquared = diag.rSquared;
    result.adjustedRSquared = diag.adjustedRSquared;
    return result;
}

RegressionMode RsaRegression::parseMode(const std::string& name) {
    const std::string lowered = CommonUtils::toLower(CommonUtils::trim(name));
    if (lowered == "ordinary" || lowered == "ols") return RegressionMode::ORDINARY;
    if (lowered == "rank" || lowered == "spearman") return RegressionMode::RANK;
    throw Geometra::ConfigurationException("regression must be one of: ordinary, rank (got '" + name + "')");
}

std::string RsaRegression::modeName(RegressionMode mode) {
    return mode == RegressionMode::RANK ? "rank" : "ordinary";
}
