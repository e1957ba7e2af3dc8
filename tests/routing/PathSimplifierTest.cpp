#include <gtest/gtest.h>
#include "../../src/routing/PathSimplifier.h"

using namespace elbow;

// =============================================================================
// Short Inputs
// =============================================================================

TEST(PathSimplifierTest, ShortInputsUnchanged) {
    EXPECT_TRUE(PathSimplifier::simplify({}).empty());

    std::vector<Point> one = {{1.0f, 2.0f}};
    EXPECT_EQ(PathSimplifier::simplify(one), one);

    std::vector<Point> pair = {{0.0f, 0.0f}, {0.0f, 10.0f}};
    EXPECT_EQ(PathSimplifier::simplify(pair), pair);
}

// =============================================================================
// Collinear Removal
// =============================================================================

TEST(PathSimplifierTest, RemovesHorizontalAndVerticalRuns) {
    std::vector<Point> horizontal = {{0.0f, 0.0f}, {5.0f, 0.0f}, {10.0f, 0.0f}};
    std::vector<Point> expectedH = {{0.0f, 0.0f}, {10.0f, 0.0f}};
    EXPECT_EQ(PathSimplifier::simplify(horizontal), expectedH);

    std::vector<Point> vertical = {{0.0f, 0.0f}, {0.0f, 5.0f}, {0.0f, 7.0f}, {0.0f, 10.0f}};
    std::vector<Point> expectedV = {{0.0f, 0.0f}, {0.0f, 10.0f}};
    EXPECT_EQ(PathSimplifier::simplify(vertical), expectedV);
}

TEST(PathSimplifierTest, KeepsCorners) {
    std::vector<Point> path = {{20.0f, 0.0f}, {100.0f, 0.0f}, {100.0f, 100.0f}, {180.0f, 100.0f}};
    EXPECT_EQ(PathSimplifier::simplify(path), path);
}

TEST(PathSimplifierTest, CollapsesDegenerateZPath) {
    // Z-path between horizontally aligned stubs
    std::vector<Point> path = {{20.0f, 0.0f}, {50.0f, 0.0f}, {50.0f, 0.0f}, {80.0f, 0.0f}};
    std::vector<Point> expected = {{20.0f, 0.0f}, {80.0f, 0.0f}};
    EXPECT_EQ(PathSimplifier::simplify(path), expected);
}

TEST(PathSimplifierTest, ExactComparisonOnly) {
    std::vector<Point> path = {{0.0f, 0.0f}, {5.0f, 0.001f}, {10.0f, 0.0f}};
    EXPECT_EQ(PathSimplifier::simplify(path), path);
}

TEST(PathSimplifierTest, KeepsEndpoints) {
    std::vector<Point> path = {{0.0f, 0.0f}, {0.0f, 5.0f}, {0.0f, 10.0f}};
    auto result = PathSimplifier::simplify(path);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result.front(), path.front());
    EXPECT_EQ(result.back(), path.back());
}

// =============================================================================
// Repeated Points
// =============================================================================

TEST(PathSimplifierTest, DropsRepeatedInteriorPoints) {
    std::vector<Point> path = {{0.0f, 0.0f}, {0.0f, 0.0f}, {0.0f, 10.0f}, {10.0f, 10.0f}, {10.0f, 10.0f}};
    std::vector<Point> expected = {{0.0f, 0.0f}, {0.0f, 10.0f}, {10.0f, 10.0f}};
    EXPECT_EQ(PathSimplifier::simplify(path), expected);
}

TEST(PathSimplifierTest, CoincidentEndsCollapseToOnePoint) {
    // Z-path between coincident stubs
    std::vector<Point> zPath = {{20.0f, 0.0f}, {20.0f, 0.0f}, {20.0f, 0.0f}, {20.0f, 0.0f}};
    std::vector<Point> expected = {{20.0f, 0.0f}};
    EXPECT_EQ(PathSimplifier::simplify(zPath), expected);

    std::vector<Point> pair = {{5.0f, 5.0f}, {5.0f, 5.0f}};
    std::vector<Point> single = {{5.0f, 5.0f}};
    EXPECT_EQ(PathSimplifier::simplify(pair), single);
}

TEST(PathSimplifierTest, ResultHasNoRepeatedNeighbours) {
    std::vector<std::vector<Point>> paths = {
        {{20.0f, 0.0f}, {20.0f, 0.0f}, {280.0f, 0.0f}, {280.0f, 0.0f}},
        {{0.0f, 0.0f}, {0.0f, 5.0f}, {3.0f, 5.0f}, {3.0f, 5.0f}, {3.0f, 9.0f}, {3.0f, 12.0f}},
        {{0.0f, 20.0f}, {0.0f, 50.0f}, {0.5f, 50.0f}, {0.5f, 80.0f}},
        {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}},
    };

    for (const auto& path : paths) {
        auto result = PathSimplifier::simplify(path);
        for (size_t i = 0; i + 1 < result.size(); ++i) {
            EXPECT_NE(result[i], result[i + 1]);
        }
    }
}

// =============================================================================
// Idempotence
// =============================================================================

TEST(PathSimplifierTest, SpikeCollapsesCompletely) {
    // Doubling back exposes a new collinear triple after the first pass
    std::vector<Point> spike = {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}, {10.0f, 0.0f}, {20.0f, 0.0f}};
    std::vector<Point> expected = {{0.0f, 0.0f}, {20.0f, 0.0f}};
    EXPECT_EQ(PathSimplifier::simplify(spike), expected);
}

TEST(PathSimplifierTest, Idempotent) {
    std::vector<std::vector<Point>> paths = {
        {{0.0f, 0.0f}, {10.0f, 0.0f}, {10.0f, 10.0f}, {10.0f, 0.0f}, {20.0f, 0.0f}},
        {{20.0f, 0.0f}, {20.0f, 0.0f}, {280.0f, 0.0f}, {280.0f, 0.0f}},
        {{0.0f, 0.0f}, {0.0f, 5.0f}, {3.0f, 5.0f}, {3.0f, 5.0f}, {3.0f, 9.0f}, {3.0f, 12.0f}},
        {{1.0f, 1.0f}, {2.0f, 3.0f}, {4.0f, 5.0f}},
        {{20.0f, 0.0f}, {20.0f, 0.0f}, {20.0f, 0.0f}, {20.0f, 0.0f}},
    };

    for (const auto& path : paths) {
        auto once = PathSimplifier::simplify(path);
        EXPECT_EQ(PathSimplifier::simplify(once), once);
    }
}
