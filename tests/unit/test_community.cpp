#include <gtest/gtest.h>
#include "metrics/metric_engine.hpp"
#include <set>

using namespace fcg;

class CommunityTest : public ::testing::Test {
protected:
    MetricEngine engine;
    WeightedGraph two_triangles{false};

    void SetUp() override {
        two_triangles.set_edge("1", "2", 1.0);
        two_triangles.set_edge("2", "3", 1.0);
        two_triangles.set_edge("1", "3", 1.0);
        two_triangles.set_edge("4", "5", 1.0);
        two_triangles.set_edge("5", "6", 1.0);
        two_triangles.set_edge("4", "6", 1.0);
        two_triangles.set_edge("3", "4", 0.1);
    }
};

// ==========================================
// Partition Tests
// ==========================================

TEST_F(CommunityTest, SplitsWeaklyBridgedTriangles) {
    Partition p = engine.compute_partition(two_triangles);

    ASSERT_EQ(p.labels.size(), 6u);
    EXPECT_EQ(p.community_count, 2);
    EXPECT_EQ(p.label_of("1"), p.label_of("2"));
    EXPECT_EQ(p.label_of("1"), p.label_of("3"));
    EXPECT_EQ(p.label_of("4"), p.label_of("5"));
    EXPECT_EQ(p.label_of("4"), p.label_of("6"));
    EXPECT_NE(p.label_of("1"), p.label_of("4"));

    // Labels are numbered by first occurrence
    EXPECT_EQ(p.label_of("1"), 0);
    EXPECT_EQ(p.label_of("4"), 1);
}

TEST_F(CommunityTest, ReportedModularityMatchesPartition) {
    Partition p = engine.compute_partition(two_triangles);

    double expected = 2.0 * (6.0 / 12.2 - 0.25);
    EXPECT_NEAR(p.modularity, expected, 1e-9);
    EXPECT_NEAR(MetricEngine::modularity(two_triangles, p.labels), p.modularity, 1e-12);
}

TEST_F(CommunityTest, DeterministicAcrossRuns) {
    Partition first = engine.compute_partition(two_triangles);
    for (int i = 0; i < 5; ++i) {
        Partition again = engine.compute_partition(two_triangles);
        EXPECT_EQ(again.labels, first.labels);
        EXPECT_DOUBLE_EQ(again.modularity, first.modularity);
    }
}

TEST_F(CommunityTest, CommunityResultRows) {
    MetricResult result = engine.compute_community(two_triangles);
    EXPECT_EQ(result.kind, MetricKind::COMMUNITY);
    ASSERT_EQ(result.rows.size(), 6u);
    EXPECT_DOUBLE_EQ(result.summary.at("Communities"), 2.0);
    EXPECT_GT(result.summary.at("Modularity"), 0.4);
    EXPECT_DOUBLE_EQ(result.value("6", "Community"), 1.0);
}

TEST_F(CommunityTest, IsolatedNodesStayAlone) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 1.0);
    g.add_node("3");

    Partition p = engine.compute_partition(g);
    EXPECT_EQ(p.label_of("1"), p.label_of("2"));
    EXPECT_NE(p.label_of("3"), p.label_of("1"));
    EXPECT_EQ(p.community_count, 2);
}

TEST_F(CommunityTest, EdgelessGraphIsAllSingletons) {
    WeightedGraph g(false);
    g.add_node("a");
    g.add_node("b");

    Partition p = engine.compute_partition(g);
    EXPECT_EQ(p.labels, (std::vector<int>{0, 1}));
    EXPECT_DOUBLE_EQ(p.modularity, 0.0);
}

TEST_F(CommunityTest, EmptyGraph) {
    Partition p = engine.compute_partition(WeightedGraph(false));
    EXPECT_TRUE(p.labels.empty());
    EXPECT_EQ(p.community_count, 0);
    EXPECT_DOUBLE_EQ(p.modularity, 0.0);
}

TEST_F(CommunityTest, ManyCliquesOnARing) {
    // Six 4-cliques joined in a ring by weak edges
    WeightedGraph g(false);
    const int cliques = 6;
    for (int c = 0; c < cliques; ++c) {
        for (int i = 0; i < 4; ++i) {
            for (int j = i + 1; j < 4; ++j) {
                g.set_edge(std::to_string(c * 4 + i), std::to_string(c * 4 + j), 1.0);
            }
        }
        g.set_edge(std::to_string(c * 4 + 3), std::to_string(((c + 1) % cliques) * 4), 0.05);
    }

    Partition p = engine.compute_partition(g);
    EXPECT_EQ(p.community_count, cliques);
    for (int c = 0; c < cliques; ++c) {
        int label = p.label_of(std::to_string(c * 4));
        for (int i = 1; i < 4; ++i) {
            EXPECT_EQ(p.label_of(std::to_string(c * 4 + i)), label);
        }
    }
    std::set<int> distinct(p.labels.begin(), p.labels.end());
    EXPECT_EQ(distinct.size(), static_cast<size_t>(cliques));
}

// ==========================================
// Modularity Tests
// ==========================================

TEST(ModularityTest, SingleCommunityIsZero) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 1.0);
    g.set_edge("2", "3", 1.0);
    EXPECT_NEAR(MetricEngine::modularity(g, {0, 0, 0}), 0.0, 1e-12);
}

TEST(ModularityTest, LabelCountMustMatch) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 1.0);
    EXPECT_THROW(MetricEngine::modularity(g, {0}), std::invalid_argument);
}

TEST(ModularityTest, ResolutionLowersScore) {
    WeightedGraph g(false);
    g.set_edge("1", "2", 1.0);
    g.set_edge("3", "4", 1.0);
    g.set_edge("2", "3", 0.2);

    std::vector<int> labels = {0, 0, 1, 1};
    EXPECT_GT(MetricEngine::modularity(g, labels, 1.0), MetricEngine::modularity(g, labels, 2.0));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
