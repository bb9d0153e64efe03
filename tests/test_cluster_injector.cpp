#include <gtest/gtest.h>

#include "ClusterInjector.h"
#include "GeometraExceptions.h"
#include "Statistics.h"
#include "TestFixtures.h"

#include <algorithm>
#include <set>
#include <utility>

namespace {

ClusterSpec spec(std::vector<int> targets, double sigma, const std::string& description = "test") {
    ClusterSpec s;
    s.targets = std::move(targets);
    s.sigmaLevel = sigma;
    s.description = description;
    return s;
}

} // namespace

TEST(ClusterInjector, ZeroSigmaLeavesDatasetAndGeneratorUntouched) {
    Dataset dataset = TestFixtures::makeDataset(8, 5, 30, 11);
    const auto before = dataset.samples();
    std::mt19937 rng(3);
    const std::mt19937 rngBefore = rng;

    const InjectionRecord record = ClusterInjector::apply(dataset, spec({1, 2, 3, 4}, 0.0), rng);

    EXPECT_FALSE(record.applied);
    EXPECT_EQ(record.affectedObservations, 20u);
    EXPECT_TRUE(record.selectedFeatures.empty());
    EXPECT_EQ(dataset.samples(), before);
    EXPECT_TRUE(rng == rngBefore);
}

TEST(ClusterInjector, FullSigmaReplacesAffectedRowsWithPattern) {
    Dataset dataset = TestFixtures::makeDataset(8, 4, 30, 12);
    const auto before = dataset.samples();
    std::mt19937 rng(5);

    const InjectionRecord record = ClusterInjector::apply(dataset, spec({5, 6}, 1.0), rng);

    ASSERT_TRUE(record.applied);
    ASSERT_EQ(record.selectedFeatures.size(), 30u);
    for (size_t i = 0; i < dataset.observationCount(); ++i) {
        const int target = dataset.targets()[i];
        if (target == 5 || target == 6) {
            for (size_t f : record.selectedFeatures) {
                EXPECT_EQ(dataset.samples()[i][f], record.pattern[f]);
            }
        } else {
            EXPECT_EQ(dataset.samples()[i], before[i]);
        }
    }
}

TEST(ClusterInjector, SelectsRoundedShareOfFeaturesAndZeroesPatternElsewhere) {
    Dataset dataset = TestFixtures::makeDataset(4, 3, 30, 13);
    std::mt19937 rng(7);

    // 0.25 * 30 = 7.5 rounds half away from zero.
    const InjectionRecord record = ClusterInjector::apply(dataset, spec({1, 2}, 0.25), rng);

    ASSERT_EQ(record.selectedFeatures.size(), 8u);
    const std::set<size_t> selected(record.selectedFeatures.begin(), record.selectedFeatures.end());
    EXPECT_EQ(selected.size(), 8u);
    for (size_t f = 0; f < record.pattern.size(); ++f) {
        if (selected.count(f) == 0) EXPECT_EQ(record.pattern[f], 0.0);
    }
}

TEST(ClusterInjector, OnlyFeatureValuesOfAffectedRowsChange) {
    Dataset dataset = TestFixtures::makeDataset(8, 3, 30, 14);
    const auto targets = dataset.targets();
    const auto chunks = dataset.chunks();
    const auto before = dataset.samples();
    std::mt19937 rng(8);

    ClusterInjector::apply(dataset, spec({2, 7}, 0.6), rng);

    EXPECT_EQ(dataset.targets(), targets);
    EXPECT_EQ(dataset.chunks(), chunks);
    EXPECT_EQ(dataset.featureCount(), 30u);
    for (size_t i = 0; i < dataset.observationCount(); ++i) {
        if (targets[i] != 2 && targets[i] != 7) EXPECT_EQ(dataset.samples()[i], before[i]);
    }
}

TEST(ClusterInjector, HigherSigmaStrictlyShrinksDistancesAmongAffectedRows) {
    const Dataset base = TestFixtures::makeDataset(8, 6, 40, 21);
    const std::vector<size_t> rows = base.indicesForTargets({1, 2, 3});
    const double baseline = TestFixtures::meanPairwiseDistance(base, rows);

    double previous = baseline;
    for (double sigma : {0.1, 0.3, 0.5, 0.7, 0.9}) {
        Dataset copy = base;
        std::mt19937 rng(99);
        ClusterInjector::apply(copy, spec({1, 2, 3}, sigma), rng);
        const double current = TestFixtures::meanPairwiseDistance(copy, rows);
        EXPECT_LT(current, previous) << "sigma " << sigma;
        EXPECT_NEAR(current, (1.0 - sigma) * baseline, 1e-9 * baseline);
        previous = current;
    }
}

TEST(ClusterInjector, SameSeedReproducesSelectionAndPattern) {
    const Dataset base = TestFixtures::makeDataset(8, 3, 30, 22);
    Dataset a = base;
    Dataset b = base;
    std::mt19937 rngA(1234);
    std::mt19937 rngB(1234);

    const InjectionRecord ra = ClusterInjector::apply(a, spec({1, 3, 5, 7}, 0.4), rngA);
    const InjectionRecord rb = ClusterInjector::apply(b, spec({1, 3, 5, 7}, 0.4), rngB);

    EXPECT_EQ(ra.selectedFeatures, rb.selectedFeatures);
    EXPECT_EQ(ra.pattern, rb.pattern);
    EXPECT_EQ(a.samples(), b.samples());
}

TEST(ClusterInjector, PatternScaleFollowsDataStandardDeviation) {
    Dataset dataset = TestFixtures::makeDataset(2, 2, 4000, 23, 2.0);
    const double dataStd = Statistics::calculateMatrixStats(dataset.samples()).stddev;
    std::mt19937 rng(17);

    const InjectionRecord record = ClusterInjector::apply(dataset, spec({1}, 1.0), rng);

    const double patternStd = Statistics::calculateStats(record.pattern).stddev;
    EXPECT_NEAR(patternStd / dataStd, 1.0, 0.1);
}

TEST(ClusterInjector, RejectsInvalidSpecs) {
    Dataset dataset = TestFixtures::makeDataset(8, 2, 10, 24);
    std::mt19937 rng(1);

    EXPECT_THROW(ClusterInjector::apply(dataset, spec({}, 0.5), rng), Geometra::InvalidClusterSpecException);
    EXPECT_THROW(ClusterInjector::apply(dataset, spec({1, 9}, 0.5), rng), Geometra::InvalidClusterSpecException);
    EXPECT_THROW(ClusterInjector::apply(dataset, spec({0}, 0.5), rng), Geometra::InvalidClusterSpecException);
    EXPECT_THROW(ClusterInjector::apply(dataset, spec({1}, 1.5), rng), Geometra::InvalidClusterSpecException);
    EXPECT_THROW(ClusterInjector::apply(dataset, spec({1}, -0.1), rng), Geometra::InvalidClusterSpecException);
}

TEST(ClusterInjector, RejectsTargetsWithoutObservationsEvenAtZeroSigma) {
    Dataset dataset(4, 3);
    dataset.addObservation({1.0, 2.0, 3.0, 4.0}, 1, 1);
    dataset.addObservation({2.0, 1.0, 0.0, 5.0}, 2, 1);
    std::mt19937 rng(1);

    EXPECT_THROW(ClusterInjector::apply(dataset, spec({3}, 0.0), rng), Geometra::InvalidClusterSpecException);
    EXPECT_THROW(ClusterInjector::apply(dataset, spec({3}, 0.5), rng), Geometra::InvalidClusterSpecException);
}
