#pragma once

#include "main.hpp"

#include <vector>

#include <opencv2/opencv.hpp>


struct PathSegment {
    enum class Kind { Line, Cubic };

    Kind kind;
    cv::Point2d c1, c2;     // unused for lines
    cv::Point2d end;
};

// Closed outline, clockwise from the nominal top-left corner
struct PiecePath {
    cv::Point2d start;
    std::vector<PathSegment> segments;
    bool closed = false;

    cv::Point2d end() const { return segments.empty() ? start : segments.back().end; }
};

class Silhouette {
public:
    static PiecePath build(double width, double height, const PieceShape& shape, double tab_size);

    // Polyline approximation, first point repeated at the end for closed paths
    static std::vector<cv::Point2d> flatten(const PiecePath& path, int steps_per_curve = 16);

    static cv::Rect2d bounds(const PiecePath& path);

    static cv::Point2d cubic_at(const cv::Point2d& p0, const cv::Point2d& c1, const cv::Point2d& c2, const cv::Point2d& p1, double t);

private:
    static void append_edge(PiecePath& path, const cv::Point2d& from, const cv::Point2d& to, const cv::Point2d& outward, EdgeType type, double tab_size);
};
