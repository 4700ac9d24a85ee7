#include <gtest/gtest.h>
#include "metrics/metric_engine.hpp"
#include <cmath>

using namespace fcg;

class ClusteringTest : public ::testing::Test {
protected:
    MetricEngine engine;
};

// ==========================================
// Weighted Clustering Coefficient Tests
// ==========================================

TEST_F(ClusteringTest, UnitTriangleIsFullyClustered) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 1.0);
    g.set_edge("2", "3", 1.0);
    g.set_edge("1", "3", 1.0);

    MetricResult result = engine.compute_clustering(g);
    ASSERT_EQ(result.rows.size(), 3u);
    for (const auto& row : result.rows) {
        EXPECT_NEAR(row.values[0], 1.0, 1e-12);
    }
    EXPECT_NEAR(result.summary.at("Average Clustering"), 1.0, 1e-12);
}

TEST_F(ClusteringTest, GeometricMeanOfScaledWeights) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 0.5);
    g.set_edge("2", "3", 0.5);
    g.set_edge("1", "3", 1.0);

    MetricResult result = engine.compute_clustering(g);
    double expected = std::cbrt(0.5 * 0.5 * 1.0);
    for (const auto& row : result.rows) {
        EXPECT_NEAR(row.values[0], expected, 1e-12);
    }
}

TEST_F(ClusteringTest, ScalingByMaxWeightMakesCoefficientScaleFree) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 2.0);
    g.set_edge("2", "3", 2.0);
    g.set_edge("1", "3", 2.0);
    g.set_edge("3", "4", 2.0);

    MetricResult result = engine.compute_clustering(g);
    EXPECT_NEAR(result.value("1", "Weighted Clustering Coefficient"), 1.0, 1e-12);
    // Node 3 closes one of its three neighbour pairs
    EXPECT_NEAR(result.value("3", "Weighted Clustering Coefficient"), 1.0 / 3.0, 1e-12);
    EXPECT_DOUBLE_EQ(result.value("4", "Weighted Clustering Coefficient"), 0.0);
}

TEST_F(ClusteringTest, PathHasNoTriangles) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 0.5);
    g.set_edge("2", "3", 0.8);

    MetricResult result = engine.compute_clustering(g);
    for (const auto& row : result.rows) {
        EXPECT_DOUBLE_EQ(row.values[0], 0.0);
    }
    EXPECT_DOUBLE_EQ(result.summary.at("Average Clustering"), 0.0);
}

TEST_F(ClusteringTest, EmptyGraph) {
    MetricResult result = engine.compute_clustering(WeightedGraph(false));
    EXPECT_TRUE(result.rows.empty());
    EXPECT_DOUBLE_EQ(result.summary.at("Average Clustering"), 0.0);
}

// ==========================================
// Weighted Degree Tests
// ==========================================

TEST_F(ClusteringTest, WeightedDegreeOfPath) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 0.5);
    g.set_edge("2", "3", 0.8);

    MetricResult result = engine.compute_degree(g);
    ASSERT_EQ(result.columns.size(), 2u);
    EXPECT_NEAR(result.value("2", "Weighted Degree"), 1.3, 1e-12);
    EXPECT_NEAR(result.value("2", "Normalized Weighted Degree"), 1.3 / 3.0, 1e-12);
    EXPECT_NEAR(result.value("1", "Weighted Degree"), 0.5, 1e-12);
}

TEST_F(ClusteringTest, NormalizedDegreeIsWeightedOverN) {
    WeightedGraph g(false);
    g.set_edge("a", "b", 0.2);
    g.set_edge("a", "c", 0.4);
    g.set_edge("a", "d", 0.6);

    MetricResult result = engine.compute_degree(g);
    for (const auto& row : result.rows) {
        EXPECT_NEAR(row.values[1], row.values[0] / 4.0, 1e-12);
    }
}

TEST_F(ClusteringTest, SelfLoopCountsTwice) {
    WeightedGraph g(false);
    g.set_edge("1", "1", 0.3);
    g.set_edge("1", "2", 0.5);

    MetricResult result = engine.compute_degree(g);
    EXPECT_NEAR(result.value("1", "Weighted Degree"), 1.1, 1e-12);
}

TEST_F(ClusteringTest, SingleNodeNormalizesToZero) {
    WeightedGraph g(false);
    g.set_edge("1", "1", 0.4);

    MetricResult result = engine.compute_degree(g);
    ASSERT_EQ(result.rows.size(), 1u);
    EXPECT_NEAR(result.rows[0].values[0], 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(result.rows[0].values[1], 0.0);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
