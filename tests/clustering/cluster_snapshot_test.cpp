// File: tests/clustering/cluster_snapshot_test.cpp
#include "clustering/cluster_snapshot.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace medeq {
namespace {

FeatureVector Point(double x, double y) {
    return FeatureVector(std::vector<double>{x, y});
}

ClusterModelSnapshot MakeSnapshot() {
    std::vector<FeatureVector> centroids = {Point(0.0, 0.0), Point(10.0, 10.0)};
    std::vector<ClusterAssignment> assignments = {
        {"r1", 0, Point(1.0, 0.0)},
        {"r2", 0, Point(0.0, 1.0)},
        {"r3", 1, Point(10.0, 9.0)},
    };
    return ClusterModelSnapshot(SnapshotID(77), centroids, assignments);
}

TEST(NearestCentroidTest, PicksClosest) {
    std::vector<FeatureVector> centroids = {Point(0.0, 0.0), Point(5.0, 5.0)};
    EXPECT_EQ(0u, NearestCentroid(centroids, Point(1.0, 1.0)));
    EXPECT_EQ(1u, NearestCentroid(centroids, Point(4.0, 4.0)));
}

TEST(NearestCentroidTest, TiesGoToLowestLabel) {
    std::vector<FeatureVector> centroids = {Point(-1.0, 0.0), Point(1.0, 0.0)};
    EXPECT_EQ(0u, NearestCentroid(centroids, Point(0.0, 3.0)));
}

TEST(NearestCentroidTest, RejectsEmptyCentroids) {
    EXPECT_THROW(NearestCentroid({}, Point(0.0, 0.0)), std::invalid_argument);
}

TEST(ClusterModelSnapshotTest, MembersAndLabels) {
    auto snapshot = MakeSnapshot();

    EXPECT_EQ(SnapshotID(77), snapshot.GetID());
    EXPECT_EQ(2u, snapshot.GetClusterCount());
    EXPECT_EQ(2u, snapshot.GetDimension());

    EXPECT_EQ(0u, *snapshot.GetLabel("r1"));
    EXPECT_EQ(1u, *snapshot.GetLabel("r3"));
    EXPECT_FALSE(snapshot.GetLabel("unknown").has_value());
    EXPECT_EQ(nullptr, snapshot.FindAssignment("unknown"));

    auto members = snapshot.GetMembers(0);
    ASSERT_EQ(2u, members.size());
    EXPECT_EQ("r1", members[0]);
    EXPECT_EQ("r2", members[1]);

    auto sizes = snapshot.GetClusterSizes();
    EXPECT_EQ(2u, sizes[0]);
    EXPECT_EQ(1u, sizes[1]);
}

TEST(ClusterModelSnapshotTest, InertiaIsSumOfSquaredDistances) {
    auto snapshot = MakeSnapshot();
    EXPECT_DOUBLE_EQ(3.0, snapshot.GetInertia());
}

TEST(ClusterModelSnapshotTest, UnknownLabelThrows) {
    auto snapshot = MakeSnapshot();
    EXPECT_THROW(snapshot.GetMemberIndices(2), std::out_of_range);
}

TEST(ClusterModelSnapshotTest, PredictChecksDimension) {
    auto snapshot = MakeSnapshot();
    EXPECT_EQ(1u, snapshot.Predict(Point(8.0, 8.0)));
    EXPECT_THROW(snapshot.Predict(FeatureVector(std::vector<double>{1.0})),
                 std::invalid_argument);
}

TEST(ClusterModelSnapshotTest, RejectsOutOfRangeLabel) {
    std::vector<FeatureVector> centroids = {Point(0.0, 0.0)};
    std::vector<ClusterAssignment> assignments = {{"r1", 3, Point(0.0, 0.0)}};
    EXPECT_THROW(ClusterModelSnapshot(SnapshotID(1), centroids, assignments),
                 std::invalid_argument);
}

TEST(ClusterModelSnapshotTest, RejectsDuplicateRecord) {
    std::vector<FeatureVector> centroids = {Point(0.0, 0.0)};
    std::vector<ClusterAssignment> assignments = {
        {"r1", 0, Point(0.0, 0.0)},
        {"r1", 0, Point(1.0, 0.0)},
    };
    EXPECT_THROW(ClusterModelSnapshot(SnapshotID(1), centroids, assignments),
                 std::invalid_argument);
}

} // namespace
} // namespace medeq
