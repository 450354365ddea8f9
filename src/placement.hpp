#pragma once

#include "main.hpp"

#include <opencv2/opencv.hpp>


struct PlacementResult {
    bool accept;
    bool placed;
    cv::Point2d position;
};

class Placement {
public:
    // Snaps to the correct position when strictly closer than threshold
    static PlacementResult evaluate(const Piece& piece, const cv::Point2d& proposed, double threshold = SNAP_THRESHOLD);

    static void apply(Piece& piece, const PlacementResult& result);
};
