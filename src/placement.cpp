#include "placement.hpp"

#include "util.hpp"


PlacementResult Placement::evaluate(const Piece& piece, const cv::Point2d& proposed, double threshold) {
    if (Util::is_near(proposed, piece.correct_position, threshold)) {
        return { true, true, piece.correct_position };
    }
    return { true, false, proposed };
}

void Placement::apply(Piece& piece, const PlacementResult& result) {
    if (!result.accept) {
        return;
    }

    piece.current_position = result.position;
    piece.placed = result.placed;
}
