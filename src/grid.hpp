#pragma once

#include "main.hpp"

#include <opencv2/opencv.hpp>


class Grid {
public:
    // cols = ceil(sqrt(n * 4/3)), rows = ceil(n / cols). rows * cols may exceed n.
    static GridSize plan(int piece_count);

    static int piece_count_for(const PuzzleConfig& config);

    // Nominal piece size, tab depth and raster padding for an image split into grid
    static PieceMetrics metrics(const cv::Size& image_size, const GridSize& grid);
};
