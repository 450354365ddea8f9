#include "silhouette.hpp"

#include <array>
#include <limits>
#include <algorithm>


namespace {

// Knob profile in edge-local units: x runs 0..1 along the edge, y is the
// offset along the outward normal in units of the tab depth. The profile is
// mirror-symmetric about x = 0.5 so a tab walked one way traces the same
// curve as the neighbour's blank walked the other way. No control point
// exceeds y = 1, so the curve never leaves the padding.
struct KnobCubic {
    cv::Point2d c1, c2, end;
};

const std::array<KnobCubic, 3> KNOB = {{
    { { 0.34, 0.00 }, { 0.40, 0.10 }, { 0.36, 0.45 } },  // neck in
    { { 0.32, 1.00 }, { 0.68, 1.00 }, { 0.64, 0.45 } },  // head
    { { 0.60, 0.10 }, { 0.66, 0.00 }, { 1.00, 0.00 } },  // neck out
}};

}


PiecePath Silhouette::build(double width, double height, const PieceShape& shape, double tab_size) {
    const cv::Point2d tl(0, 0), tr(width, 0), br(width, height), bl(0, height);

    PiecePath path;
    path.start = tl;
    append_edge(path, tl, tr, cv::Point2d(0, -1), shape.top, tab_size);
    append_edge(path, tr, br, cv::Point2d(1, 0), shape.right, tab_size);
    append_edge(path, br, bl, cv::Point2d(0, 1), shape.bottom, tab_size);
    append_edge(path, bl, tl, cv::Point2d(-1, 0), shape.left, tab_size);
    path.closed = true;
    return path;
}

void Silhouette::append_edge(PiecePath& path, const cv::Point2d& from, const cv::Point2d& to, const cv::Point2d& outward, EdgeType type, double tab_size) {
    if (type == EdgeType::Flat) {
        path.segments.push_back({ PathSegment::Kind::Line, {}, {}, to });
        return;
    }

    const cv::Point2d along = to - from;
    const double depth = (type == EdgeType::Tab ? 1.0 : -1.0) * tab_size;
    auto local = [&](const cv::Point2d& p) {
        return from + along * p.x + outward * (p.y * depth);
    };

    for (size_t i = 0; i < KNOB.size(); ++i) {
        // Pin the final point to the corner so the edges join exactly
        cv::Point2d end = (i + 1 == KNOB.size()) ? to : local(KNOB[i].end);
        path.segments.push_back({ PathSegment::Kind::Cubic, local(KNOB[i].c1), local(KNOB[i].c2), end });
    }
}

cv::Point2d Silhouette::cubic_at(const cv::Point2d& p0, const cv::Point2d& c1, const cv::Point2d& c2, const cv::Point2d& p1, double t) {
    double u = 1.0 - t;
    return p0 * (u * u * u) + c1 * (3 * u * u * t) + c2 * (3 * u * t * t) + p1 * (t * t * t);
}

std::vector<cv::Point2d> Silhouette::flatten(const PiecePath& path, int steps_per_curve) {
    std::vector<cv::Point2d> points{ path.start };
    cv::Point2d cursor = path.start;
    int steps = std::max(1, steps_per_curve);

    for (const auto& seg : path.segments) {
        if (seg.kind == PathSegment::Kind::Line) {
            points.push_back(seg.end);
        }
        else {
            for (int i = 1; i <= steps; ++i) {
                points.push_back(i == steps ? seg.end : cubic_at(cursor, seg.c1, seg.c2, seg.end, static_cast<double>(i) / steps));
            }
        }
        cursor = seg.end;
    }

    if (path.closed && points.back() != path.start) {
        points.push_back(path.start);
    }
    return points;
}

cv::Rect2d Silhouette::bounds(const PiecePath& path) {
    double min_x = std::numeric_limits<double>::max(), min_y = min_x;
    double max_x = std::numeric_limits<double>::lowest(), max_y = max_x;

    for (const auto& p : flatten(path, 32)) {
        min_x = std::min(min_x, p.x); max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y); max_y = std::max(max_y, p.y);
    }
    return cv::Rect2d(min_x, min_y, max_x - min_x, max_y - min_y);
}
