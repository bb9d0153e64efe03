#include <gtest/gtest.h>

#include "ClusteredDatasetBuilder.h"
#include "GeometraExceptions.h"
#include "RoiProfiles.h"
#include "TestFixtures.h"

TEST(ClusteredDatasetBuilder, AppliesSpecsInOrderAndLabelsRows) {
    const Dataset base = TestFixtures::makeDataset(8, 4, 30, 31);
    const ClusteringScheme scheme = RoiProfiles::clusteringScheme(RoiProfile::IT);
    std::mt19937 rng(77);

    const ClusteredDatasetResult result =
        ClusteredDatasetBuilder::build(base, scheme, RoiProfiles::defaultTargetLabels(), rng);

    ASSERT_EQ(result.appliedClusters.size(), scheme.clusters.size());
    ASSERT_EQ(result.injections.size(), scheme.clusters.size());
    for (size_t i = 0; i < scheme.clusters.size(); ++i) {
        EXPECT_EQ(result.appliedClusters[i].description, scheme.clusters[i].description);
        EXPECT_EQ(result.appliedClusters[i].targets, scheme.clusters[i].targets);
        EXPECT_TRUE(result.injections[i].applied);
    }

    ASSERT_TRUE(result.dataset.isLabeled());
    for (size_t i = 0; i < result.dataset.observationCount(); ++i) {
        const int target = result.dataset.targets()[i];
        EXPECT_EQ(result.dataset.labels()[i], RoiProfiles::defaultTargetLabels().at(target));
    }
    EXPECT_EQ(result.dataset.labelForTarget(1), "human face");
}

TEST(ClusteredDatasetBuilder, ReproducesInjectionWithSameSeed) {
    const Dataset base = TestFixtures::makeDataset(8, 3, 30, 32);
    const ClusteringScheme scheme = RoiProfiles::clusteringScheme(RoiProfile::V1);
    std::mt19937 rngA(5);
    std::mt19937 rngB(5);

    const auto a = ClusteredDatasetBuilder::build(base, scheme, RoiProfiles::defaultTargetLabels(), rngA);
    const auto b = ClusteredDatasetBuilder::build(base, scheme, RoiProfiles::defaultTargetLabels(), rngB);

    EXPECT_EQ(a.dataset.samples(), b.dataset.samples());
}

TEST(ClusteredDatasetBuilder, EmptySchemeOnlyLabels) {
    const Dataset base = TestFixtures::makeDataset(8, 2, 6, 33);
    std::mt19937 rng(1);

    const auto result = ClusteredDatasetBuilder::build(base, RoiProfiles::clusteringScheme(RoiProfile::NONE),
                                                       RoiProfiles::defaultTargetLabels(), rng);

    EXPECT_TRUE(result.appliedClusters.empty());
    EXPECT_EQ(result.dataset.samples(), base.samples());
    EXPECT_TRUE(result.dataset.isLabeled());
}

TEST(ClusteredDatasetBuilder, MissingLabelNamesTheTarget) {
    const Dataset base = TestFixtures::makeDataset(3, 2, 6, 34);
    const TargetLabelMap labels = {{1, "one"}, {3, "three"}};
    std::mt19937 rng(1);

    try {
        ClusteredDatasetBuilder::build(base, ClusteringScheme{"none", {}}, labels, rng);
        FAIL() << "expected UnknownTargetIdException";
    } catch (const Geometra::UnknownTargetIdException& ex) {
        EXPECT_EQ(ex.targetId(), 2);
    }
}

TEST(ClusteredDatasetBuilder, PropagatesInvalidSpec) {
    const Dataset base = TestFixtures::makeDataset(4, 2, 6, 35);
    ClusteringScheme scheme;
    scheme.description = "bad";
    scheme.clusters.push_back(ClusterSpec{{1, 2}, 0.5, "fine"});
    scheme.clusters.push_back(ClusterSpec{{5}, 0.5, "out of range"});
    std::mt19937 rng(1);

    EXPECT_THROW(ClusteredDatasetBuilder::build(base, scheme, RoiProfiles::defaultTargetLabels(), rng),
                 Geometra::InvalidClusterSpecException);
}

TEST(Dataset, RejectsMalformedObservations) {
    Dataset dataset(3, 2);
    EXPECT_THROW(dataset.addObservation({1.0, 2.0}, 1, 1), Geometra::DatasetException);
    EXPECT_THROW(dataset.addObservation({1.0, 2.0, 3.0}, 3, 1), Geometra::DatasetException);
    EXPECT_THROW(dataset.addObservation({1.0, 2.0, 3.0}, 0, 1), Geometra::DatasetException);
    dataset.addObservation({1.0, 2.0, 3.0}, 2, 4);
    EXPECT_EQ(dataset.observationCount(), 1u);
    EXPECT_EQ(dataset.labelForTarget(2), "target 2");
}
