// File: tests/clustering/dbscan_test.cpp
#include "clustering/dbscan.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace recur {
namespace {

FeatureVector Point(float x, float y) {
    return FeatureVector(std::vector<float>{x, y});
}

TEST(DbscanClustererTest, RejectsInvalidConfig) {
    EXPECT_THROW({ DbscanClusterer dbscan(DbscanClusterer::Config{0.0, 3}); },
                 std::invalid_argument);
    EXPECT_THROW({ DbscanClusterer dbscan(DbscanClusterer::Config{1.0, 0}); },
                 std::invalid_argument);
}

TEST(DbscanClustererTest, EmptyInputGivesNoLabels) {
    DbscanClusterer dbscan(DbscanClusterer::Config{1.0, 2});
    EXPECT_TRUE(dbscan.Cluster(std::vector<FeatureVector>{}).empty());
}

TEST(DbscanClustererTest, SeparatesTwoGroupsAndNoise) {
    std::vector<FeatureVector> rows = {
        Point(0.0f, 0.0f), Point(0.1f, 0.0f), Point(0.0f, 0.1f),
        Point(5.0f, 5.0f), Point(5.1f, 5.0f), Point(5.0f, 5.1f),
        Point(20.0f, 20.0f),
    };
    DbscanClusterer dbscan(DbscanClusterer::Config{0.5, 3});
    std::vector<int> labels = dbscan.Cluster(rows);

    ASSERT_EQ(7u, labels.size());
    EXPECT_EQ(0, labels[0]);
    EXPECT_EQ(0, labels[1]);
    EXPECT_EQ(0, labels[2]);
    EXPECT_EQ(1, labels[3]);
    EXPECT_EQ(1, labels[5]);
    EXPECT_EQ(DbscanClusterer::kNoise, labels[6]);
}

TEST(DbscanClustererTest, NeighbourhoodCountsThePointItself) {
    std::vector<FeatureVector> rows = {Point(0.0f, 0.0f), Point(0.2f, 0.0f)};

    EXPECT_EQ(0, DbscanClusterer(DbscanClusterer::Config{0.5, 2}).Cluster(rows)[0]);
    EXPECT_EQ(DbscanClusterer::kNoise,
              DbscanClusterer(DbscanClusterer::Config{0.5, 3}).Cluster(rows)[0]);
}

TEST(DbscanClustererTest, BorderPointJoinsButDoesNotExpand) {
    // 0..2 are core, 3 is reachable only from 2, 4 is isolated
    std::vector<FeatureVector> rows = {
        Point(0.0f, 0.0f), Point(0.1f, 0.0f), Point(0.2f, 0.0f),
        Point(0.6f, 0.0f), Point(1.1f, 0.0f),
    };
    DbscanClusterer dbscan(DbscanClusterer::Config{0.45, 3});
    std::vector<int> labels = dbscan.Cluster(rows);

    EXPECT_EQ(0, labels[3]);
    EXPECT_EQ(DbscanClusterer::kNoise, labels[4]);
}

TEST(DbscanClustererTest, RejectsMixedDimensions) {
    std::vector<FeatureVector> rows = {Point(0.0f, 0.0f), FeatureVector(3)};
    DbscanClusterer dbscan(DbscanClusterer::Config{1.0, 1});
    EXPECT_THROW(dbscan.Cluster(rows), std::invalid_argument);
}

TEST(DbscanClustererTest, GroupClustersSkipsNoise) {
    std::vector<int> labels = {1, -1, 0, 1, 0, -1};
    auto groups = DbscanClusterer::GroupClusters(labels);

    ASSERT_EQ(2u, groups.size());
    EXPECT_EQ(0, groups[0].label);
    EXPECT_EQ((std::vector<size_t>{2, 4}), groups[0].rows);
    EXPECT_EQ(1, groups[1].label);
    EXPECT_EQ((std::vector<size_t>{0, 3}), groups[1].rows);
}

TEST(DbscanClustererTest, ClustersFeatureMatrixRows) {
    FeatureVector near_a(kBaseFeatureWidth);
    FeatureVector near_b(kBaseFeatureWidth);
    near_b[0] = 0.01f;
    FeatureMatrix matrix(FeatureMode::BASE, {near_a, near_b, near_a});

    DbscanClusterer dbscan(DbscanClusterer::Config{0.1, 3});
    std::vector<int> labels = dbscan.Cluster(matrix);
    EXPECT_EQ((std::vector<int>{0, 0, 0}), labels);
}

} // namespace
} // namespace recur
