#include <gtest/gtest.h>

#include "ClusteredDatasetBuilder.h"
#include "GeometraExceptions.h"
#include "ModelRdmGenerator.h"
#include "ObservedRdmBuilder.h"
#include "ReportPrinter.h"
#include "RoiProfiles.h"
#include "RsaRegression.h"
#include "TestFixtures.h"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {

ClusteringScheme partition(const std::string& description, std::vector<int> a, std::vector<int> b) {
    ClusteringScheme scheme;
    scheme.description = description;
    scheme.clusters.push_back(ClusterSpec{std::move(a), 0.0, description + " A"});
    scheme.clusters.push_back(ClusterSpec{std::move(b), 0.0, description + " B"});
    return scheme;
}

std::vector<ModelRdm> candidateModels() {
    return ModelRdmGenerator::generateAll(8, {
        partition("animacy", {1, 2, 3, 4}, {5, 6, 7, 8}),
        partition("parity", {1, 3, 5, 7}, {2, 4, 6, 8}),
        partition("pairs", {1, 2, 5, 6}, {3, 4, 7, 8})
    });
}

ObservedRdm animacyObserved(uint32_t seed) {
    ClusteringScheme scheme = partition("animacy", {1, 2, 3, 4}, {5, 6, 7, 8});
    for (ClusterSpec& spec : scheme.clusters) spec.sigmaLevel = 0.9;
    std::mt19937 rng(seed);
    const auto clustered = ClusteredDatasetBuilder::build(TestFixtures::makeDataset(8, 6, 200, seed), scheme,
                                                          RoiProfiles::defaultTargetLabels(), rng);
    return ObservedRdmBuilder::build(clustered.dataset);
}

size_t argmax(const std::vector<double>& values) {
    return static_cast<size_t>(std::max_element(values.begin(), values.end()) - values.begin());
}

} // namespace

TEST(RsaRegression, MatchingModelCarriesTheLargestWeight) {
    const ObservedRdm observed = animacyObserved(51);
    const RsaRegressionResult result = RsaRegression::fit(observed, candidateModels());

    ASSERT_EQ(result.coefficients.size(), 3u);
    EXPECT_EQ(result.descriptions.front(), "animacy");
    EXPECT_EQ(argmax(result.coefficients), 0u);
    EXPECT_GT(result.coefficients[0], 0.8);
    EXPECT_LT(result.pValues[0], 0.05);
    EXPECT_GT(result.rSquared, 0.8);
    EXPECT_EQ(result.pairCount, 28u);
    EXPECT_TRUE(result.droppedModels.empty());
}

TEST(RsaRegression, RankModeAgreesOnTheWinningModel) {
    const ObservedRdm observed = animacyObserved(52);
    RsaRegressionOptions options;
    options.mode = RegressionMode::RANK;

    const RsaRegressionResult result = RsaRegression::fit(observed, candidateModels(), options);

    EXPECT_EQ(argmax(result.coefficients), 0u);
    EXPECT_GT(result.coefficients[0], 0.0);
}

TEST(RsaRegression, ObservedEqualToModelGivesUnitStandardizedWeight) {
    const std::vector<ModelRdm> models = candidateModels();
    ObservedRdm observed;
    observed.matrix = models[1].matrix;

    const RsaRegressionResult result = RsaRegression::fit(observed, {models[1]});

    EXPECT_NEAR(result.coefficients[0], 1.0, 1e-9);
    EXPECT_NEAR(result.intercept, 0.0, 1e-9);
    EXPECT_NEAR(result.rSquared, 1.0, 1e-9);
}

TEST(RsaRegression, UnstandardizedFitRecoversRawScale) {
    const std::vector<ModelRdm> models = candidateModels();
    ObservedRdm observed;
    observed.matrix = models[0].matrix;
    for (size_t i = 0; i < 8; ++i) {
        for (size_t j = 0; j < 8; ++j) {
            if (i != j) observed.matrix[i][j] = 0.5 + 0.25 * models[0].matrix[i][j];
        }
    }
    RsaRegressionOptions options;
    options.standardize = false;

    const RsaRegressionResult result = RsaRegression::fit(observed, {models[0]}, options);

    EXPECT_NEAR(result.coefficients[0], 0.25, 1e-9);
    EXPECT_NEAR(result.intercept, 0.5, 1e-9);
}

TEST(RsaRegression, ConstantModelIsDroppedWithZeroWeight) {
    std::vector<ModelRdm> models = candidateModels();
    ClusteringScheme everything;
    everything.description = "everything together";
    everything.clusters.push_back(ClusterSpec{{1, 2, 3, 4, 5, 6, 7, 8}, 0.0, "all"});
    models.push_back(ModelRdmGenerator::generate(8, everything));

    const RsaRegressionResult result = RsaRegression::fit(animacyObserved(53), models);

    ASSERT_EQ(result.coefficients.size(), 4u);
    EXPECT_EQ(result.coefficients[3], 0.0);
    ASSERT_EQ(result.droppedModels.size(), 1u);
    EXPECT_EQ(result.droppedModels.front(), "everything together");
    EXPECT_EQ(result.droppedModelIndices, (std::vector<size_t>{3}));
    EXPECT_EQ(argmax(result.coefficients), 0u);
}

TEST(RsaRegression, RejectsModelsOfAnotherSize) {
    ObservedRdm observed = animacyObserved(54);
    std::vector<ModelRdm> models = candidateModels();
    models.push_back(ModelRdmGenerator::generate(6, partition("small", {1, 2, 3}, {4, 5, 6})));

    EXPECT_THROW(RsaRegression::fit(observed, models), Geometra::DimensionMismatchException);
}

TEST(RsaRegression, RejectsDegenerateFits) {
    const ObservedRdm observed = animacyObserved(55);
    const std::vector<ModelRdm> models = candidateModels();

    EXPECT_THROW(RsaRegression::fit(observed, {}), Geometra::RegressionException);
    EXPECT_THROW(RsaRegression::fit(observed, {models[0], models[0]}), Geometra::RegressionException);

    ClusteringScheme everything;
    everything.description = "flat";
    everything.clusters.push_back(ClusterSpec{{1, 2, 3, 4, 5, 6, 7, 8}, 0.0, "all"});
    EXPECT_THROW(RsaRegression::fit(observed, {ModelRdmGenerator::generate(8, everything)}),
                 Geometra::RegressionException);

    ObservedRdm flat;
    flat.matrix = RdmUtils::filled(8, 1.0);
    for (size_t i = 0; i < 8; ++i) flat.matrix[i][i] = 0.0;
    EXPECT_THROW(RsaRegression::fit(flat, models), Geometra::RegressionException);
}

TEST(RsaRegression, TooFewPairsForTheModels) {
    ObservedRdm observed;
    observed.matrix = {{0.0, 0.4, 1.2}, {0.4, 0.0, 0.9}, {1.2, 0.9, 0.0}};
    ClusteringScheme first;
    first.description = "first";
    first.clusters.push_back(ClusterSpec{{1, 2}, 0.0, "a"});
    ClusteringScheme second;
    second.description = "second";
    second.clusters.push_back(ClusterSpec{{2, 3}, 0.0, "b"});

    EXPECT_THROW(RsaRegression::fit(observed, ModelRdmGenerator::generateAll(3, {first, second})),
                 Geometra::RegressionException);
}

TEST(RsaRegression, ParsesModeNames) {
    EXPECT_EQ(RsaRegression::parseMode("OLS"), RegressionMode::ORDINARY);
    EXPECT_EQ(RsaRegression::parseMode("spearman"), RegressionMode::RANK);
    EXPECT_EQ(RsaRegression::modeName(RegressionMode::RANK), "rank");
    EXPECT_THROW(RsaRegression::parseMode("lasso"), Geometra::ConfigurationException);
}

TEST(RsaRegression, SharedDescriptionsDoNotHideInformativeModels) {
    std::vector<ModelRdm> models = candidateModels();
    ClusteringScheme everything;
    everything.description = "animacy";
    everything.clusters.push_back(ClusterSpec{{1, 2, 3, 4, 5, 6, 7, 8}, 0.0, "all"});
    models.push_back(ModelRdmGenerator::generate(8, everything));

    const RsaRegressionResult result = RsaRegression::fit(animacyObserved(56), models);

    ASSERT_EQ(result.droppedModelIndices, (std::vector<size_t>{3}));
    EXPECT_NE(result.coefficients[0], 0.0);

    std::ostringstream os;
    ReportPrinter::printCoefficients(os, result);
    const std::string table = os.str();
    const size_t first = table.find("excluded");
    ASSERT_NE(first, std::string::npos);
    EXPECT_EQ(table.find("excluded", first + 1), std::string::npos);

    // The informative "animacy" row is printed with its t statistic, the constant one is not.
    const size_t informativeRow = table.find("animacy");
    const size_t constantRow = table.find("animacy", informativeRow + 1);
    ASSERT_NE(constantRow, std::string::npos);
    EXPECT_LT(constantRow, first);
    EXPECT_EQ(table.substr(informativeRow, constantRow - informativeRow).find("excluded"), std::string::npos);
}
