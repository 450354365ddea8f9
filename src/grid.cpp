#include "grid.hpp"

#include <cmath>
#include <algorithm>


GridSize Grid::plan(int piece_count) {
    int cols = static_cast<int>(std::ceil(std::sqrt(piece_count * 4.0 / 3.0)));
    int rows = (piece_count + cols - 1) / cols;
    return { rows, cols };
}

int Grid::piece_count_for(const PuzzleConfig& config) {
    switch (config.difficulty) {
        case Difficulty::Easy:   return EASY_PIECE_COUNT;
        case Difficulty::Medium: return MEDIUM_PIECE_COUNT;
        case Difficulty::Hard:   return HARD_PIECE_COUNT;
        case Difficulty::Custom: return config.piece_count;
    }
    return config.piece_count;
}

PieceMetrics Grid::metrics(const cv::Size& image_size, const GridSize& grid) {
    PieceMetrics m;
    m.width = image_size.width / grid.cols;
    m.height = image_size.height / grid.rows;

    // Follows the width; on very flat pieces the height cap keeps top and bottom blanks apart
    m.tab_size = std::min(TAB_SIZE_RATIO * m.width, TAB_HEIGHT_CAP_RATIO * m.height);
    m.padding = static_cast<int>(std::ceil(TAB_SIZE_RATIO * m.width)) + OUTLINE_MARGIN;
    return m;
}
