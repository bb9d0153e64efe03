#pragma once
#include "ModelRdmGenerator.h"
#include "ObservedRdmBuilder.h"
#include <cstddef>
#include <string>
#include <vector>

enum class RegressionMode { ORDINARY, RANK };

struct RsaRegressionOptions {
    RegressionMode mode = RegressionMode::ORDINARY;
    // z-score the response and every regressor before fitting
    bool standardize = true;
};

struct RsaRegressionResult {
    std::vector<std::string> descriptions;   // model order
    std::vector<double> coefficients;        // model order, 0 for dropped models
    std::vector<double> tStats;
    std::vector<double> pValues;
    std::vector<std::string> droppedModels;  // constant regressors excluded from the fit
    std::vector<size_t> droppedModelIndices; // positions of droppedModels in model order
    double intercept = 0.0;
    double rSquared = 0.0;
    double adjustedRSquared = 0.0;
    size_t pairCount = 0;
};

class RsaRegression {
public:
    /**
     * @brief Regresses the observed RDM's upper triangle on the stacked model upper triangles.
     *
     * Fits ordinary least squares with an intercept (on ranks in RANK mode) and
     * returns one coefficient per model in input order. A model whose flattened
     * vector is constant cannot explain variance; it gets coefficient 0 and is
     * reported in droppedModels.
     * @throws Geometra::DimensionMismatchException when any model is not the observed size.
     * @throws Geometra::RegressionException when no model is informative, the models are
     *         collinear, or there are too few condition pairs for the number of models.
     */
    static RsaRegressionResult fit(const ObservedRdm& observed,
                                   const std::vector<ModelRdm>& models,
                                   const RsaRegressionOptions& options = RsaRegressionOptions());

    static RegressionMode parseMode(const std::string& name);
    static std::string modeName(RegressionMode mode);
};
