#include "topology.hpp"

#include <gtest/gtest.h>


static void expect_valid_topology(const EdgeTopology& t) {
    const GridSize& g = t.grid;
    ASSERT_EQ(static_cast<int>(t.shapes.size()), g.rows * g.cols);

    for (int r = 0; r < g.rows; ++r) {
        for (int c = 0; c < g.cols; ++c) {
            const PieceShape& s = t.at(r, c);

            if (r == 0) EXPECT_EQ(s.top, EdgeType::Flat);
            else EXPECT_TRUE(Topology::is_complementary(s.top, t.at(r - 1, c).bottom)) << r << "," << c;

            if (c == 0) EXPECT_EQ(s.left, EdgeType::Flat);
            else EXPECT_TRUE(Topology::is_complementary(s.left, t.at(r, c - 1).right)) << r << "," << c;

            if (r == g.rows - 1) EXPECT_EQ(s.bottom, EdgeType::Flat);
            if (c == g.cols - 1) EXPECT_EQ(s.right, EdgeType::Flat);
        }
    }
}

TEST(topology, sharedEdgesAreComplementary) {
    for (uint64_t seed : { 1u, 2u, 42u, 1234u }) {
        cv::RNG rng(seed);
        expect_valid_topology(Topology::generate({ 6, 8 }, rng));
        expect_valid_topology(Topology::generate({ 3, 4 }, rng));
        expect_valid_topology(Topology::generate({ 1, 5 }, rng));
        expect_valid_topology(Topology::generate({ 7, 1 }, rng));
    }
}

TEST(topology, singleCellIsAllFlat) {
    cv::RNG rng(7);
    EdgeTopology t = Topology::generate({ 1, 1 }, rng);
    const PieceShape& s = t.at(0, 0);
    EXPECT_EQ(s.top, EdgeType::Flat);
    EXPECT_EQ(s.right, EdgeType::Flat);
    EXPECT_EQ(s.bottom, EdgeType::Flat);
    EXPECT_EQ(s.left, EdgeType::Flat);
}

TEST(topology, sameSeedSameShapes) {
    cv::RNG a(99), b(99);
    EdgeTopology ta = Topology::generate({ 10, 13 }, a);
    EdgeTopology tb = Topology::generate({ 10, 13 }, b);

    for (size_t i = 0; i < ta.shapes.size(); ++i) {
        EXPECT_EQ(ta.shapes[i].top, tb.shapes[i].top);
        EXPECT_EQ(ta.shapes[i].right, tb.shapes[i].right);
        EXPECT_EQ(ta.shapes[i].bottom, tb.shapes[i].bottom);
        EXPECT_EQ(ta.shapes[i].left, tb.shapes[i].left);
    }
}

TEST(topology, bothOrientationsOccur) {
    cv::RNG rng(5);
    EdgeTopology t = Topology::generate({ 10, 13 }, rng);

    int tabs = 0, blanks = 0;
    for (const auto& s : t.shapes) {
        tabs += (s.right == EdgeType::Tab);
        blanks += (s.right == EdgeType::Blank);
    }
    EXPECT_GT(tabs, 0);
    EXPECT_GT(blanks, 0);
}

TEST(topology, edgeNamesRoundTrip) {
    for (EdgeType type : { EdgeType::Flat, EdgeType::Tab, EdgeType::Blank }) {
        EXPECT_EQ(Topology::edge_from_string(Topology::to_string(type)), type);
    }
    EXPECT_THROW(Topology::edge_from_string("knob"), ConfigError);
}
