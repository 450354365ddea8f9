#include "grid.hpp"

#include <gtest/gtest.h>


TEST(grid, difficultyPresets) {
    GridSize easy = Grid::plan(EASY_PIECE_COUNT);
    EXPECT_EQ(easy.rows, 3);
    EXPECT_EQ(easy.cols, 4);

    GridSize medium = Grid::plan(MEDIUM_PIECE_COUNT);
    EXPECT_EQ(medium.rows, 6);
    EXPECT_EQ(medium.cols, 8);

    GridSize hard = Grid::plan(HARD_PIECE_COUNT);
    EXPECT_EQ(hard.rows, 10);
    EXPECT_EQ(hard.cols, 13);
}

TEST(grid, coversRequestedCountForWholeRange) {
    for (int n = MIN_PIECE_COUNT; n <= MAX_PIECE_COUNT; ++n) {
        GridSize g = Grid::plan(n);
        ASSERT_GE(g.rows * g.cols, n) << "n=" << n;

        // No spare row: dropping one would fall short
        ASSERT_LT((g.rows - 1) * g.cols, n) << "n=" << n;

        // Landscape-leaning, close to 4:3
        ASSERT_GE(g.cols, g.rows) << "n=" << n;
        ASSERT_LE(std::abs(static_cast<double>(g.cols) / g.rows - 4.0 / 3.0), 0.75) << "n=" << n;
    }
}

TEST(grid, planIsDeterministic) {
    for (int n : { 6, 17, 99, 300 }) {
        GridSize a = Grid::plan(n), b = Grid::plan(n);
        EXPECT_EQ(a.rows, b.rows);
        EXPECT_EQ(a.cols, b.cols);
    }
}

TEST(grid, pieceCountFollowsDifficulty) {
    PuzzleConfig config;
    config.piece_count = 77;

    config.difficulty = Difficulty::Easy;
    EXPECT_EQ(Grid::piece_count_for(config), 12);
    config.difficulty = Difficulty::Medium;
    EXPECT_EQ(Grid::piece_count_for(config), 48);
    config.difficulty = Difficulty::Hard;
    EXPECT_EQ(Grid::piece_count_for(config), 120);
    config.difficulty = Difficulty::Custom;
    EXPECT_EQ(Grid::piece_count_for(config), 77);
}

TEST(grid, metricsPaddingCoversTab) {
    PieceMetrics m = Grid::metrics(cv::Size(800, 600), Grid::plan(12));
    EXPECT_EQ(m.width, 200);
    EXPECT_EQ(m.height, 200);
    EXPECT_DOUBLE_EQ(m.tab_size, 40.0);
    EXPECT_GE(m.padding, TAB_SIZE_RATIO * m.width);

    // Landscape pieces still take their depth from the width
    PieceMetrics landscape = Grid::metrics(cv::Size(800, 450), Grid::plan(12));
    EXPECT_EQ(landscape.width, 200);
    EXPECT_EQ(landscape.height, 150);
    EXPECT_DOUBLE_EQ(landscape.tab_size, 40.0);

    // Very flat pieces: depth is capped by the height, padding still follows the width
    PieceMetrics wide = Grid::metrics(cv::Size(1600, 300), Grid::plan(12));
    EXPECT_EQ(wide.width, 400);
    EXPECT_EQ(wide.height, 100);
    EXPECT_DOUBLE_EQ(wide.tab_size, 40.0);
    EXPECT_GE(wide.padding, 80);
    EXPECT_LT(2 * wide.tab_size, wide.height);
}
