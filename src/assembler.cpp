#include "assembler.hpp"

#include "grid.hpp"
#include "extractor.hpp"
#include "silhouette.hpp"

#include <string>
#include <utility>
#include <algorithm>


void Assembler::validate(const cv::Mat& image, const PuzzleConfig& config) {
    if (image.empty()) {
        throw ImageLoadError("Image is empty or could not be decoded");
    }

    int count = Grid::piece_count_for(config);
    if (count < MIN_PIECE_COUNT || count > MAX_PIECE_COUNT) {
        throw ConfigError("Piece count must be between " + std::to_string(MIN_PIECE_COUNT) + " and " + std::to_string(MAX_PIECE_COUNT) + ", got " + std::to_string(count));
    }

    PieceMetrics m = Grid::metrics(image.size(), Grid::plan(count));
    if (m.width <= 0 || m.height <= 0) {
        throw ConfigError("Image " + std::to_string(image.cols) + "x" + std::to_string(image.rows) + " is too small for " + std::to_string(count) + " pieces");
    }
}

cv::Size Assembler::default_canvas(const cv::Size& image_size, const PieceMetrics& metrics) {
    return cv::Size(image_size.width * 3 / 2 + 2 * metrics.padding, image_size.height * 3 / 2 + 2 * metrics.padding);
}

cv::Size Assembler::minimum_canvas(const GridSize& grid, const PieceMetrics& metrics) {
    return cv::Size(grid.cols * metrics.width + 2 * metrics.padding, grid.rows * metrics.height + 2 * metrics.padding);
}

GeneratedPuzzle Assembler::assemble(const cv::Mat& image, const PuzzleConfig& config, cv::Size canvas, uint64_t seed, const std::atomic<bool>* cancel) {
    validate(image, config);

    GeneratedPuzzle puzzle;
    puzzle.config = config;
    puzzle.seed = seed;
    puzzle.grid = Grid::plan(Grid::piece_count_for(config));
    puzzle.metrics = Grid::metrics(image.size(), puzzle.grid);
    puzzle.canvas = (canvas.width == 0 && canvas.height == 0) ? default_canvas(image.size(), puzzle.metrics) : canvas;

    cv::Size minimum = minimum_canvas(puzzle.grid, puzzle.metrics);
    if (puzzle.canvas.width < minimum.width || puzzle.canvas.height < minimum.height) {
        throw ConfigError("Canvas " + std::to_string(puzzle.canvas.width) + "x" + std::to_string(puzzle.canvas.height) + " is smaller than the assembled puzzle (" + std::to_string(minimum.width) + "x" + std::to_string(minimum.height) + ")");
    }

    cv::RNG rng(seed);
    EdgeTopology topology = Topology::generate(puzzle.grid, rng);
    puzzle.pieces = generate(image, topology, puzzle.metrics, cancel);

    if (config.shuffled) {
        shuffle(puzzle.pieces, puzzle.canvas, rng);
    }
    return puzzle;
}

std::vector<Piece> Assembler::generate(const cv::Mat& image, const EdgeTopology& topology, const PieceMetrics& metrics, const std::atomic<bool>* cancel) {
    const GridSize& grid = topology.grid;
    std::vector<Piece> pieces;
    pieces.reserve(grid.rows * grid.cols);

    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            if (cancel && cancel->load()) {
                throw GenerationCancelled();
            }

            Piece piece;
            piece.id = "piece-" + std::to_string(r) + "-" + std::to_string(c);
            piece.coord = { r, c };
            piece.shape = topology.at(r, c);
            piece.padding = metrics.padding;

            PiecePath path = Silhouette::build(metrics.width, metrics.height, piece.shape, metrics.tab_size);
            cv::Point origin(c * metrics.width, r * metrics.height);
            piece.image = Extractor::extract(image, origin, metrics.width, metrics.height, path, metrics.padding);
            piece.png = Extractor::encode_png(piece.image);

            // Report the allocated raster, not the nominal size
            piece.width = piece.image.cols;
            piece.height = piece.image.rows;

            piece.correct_position = cv::Point2d(c * metrics.width, r * metrics.height);
            pieces.push_back(std::move(piece));
        }
    }

    arrange_solved(pieces);
    return pieces;
}

void Assembler::arrange_solved(std::vector<Piece>& pieces) {
    for (auto& piece : pieces) {
        piece.current_position = piece.correct_position;
        piece.placed = true;
    }
}

void Assembler::shuffle(std::vector<Piece>& pieces, const cv::Size& canvas, cv::RNG& rng) {
    for (int i = static_cast<int>(pieces.size()) - 1; i > 0; --i) {
        int j = rng.uniform(0, i + 1);
        std::swap(pieces[i], pieces[j]);
    }

    for (auto& piece : pieces) {
        double max_x = std::max(0, canvas.width - piece.width);
        double max_y = std::max(0, canvas.height - piece.height);
        piece.current_position = cv::Point2d(max_x > 0 ? rng.uniform(0.0, max_x) : 0.0, max_y > 0 ? rng.uniform(0.0, max_y) : 0.0);
        piece.placed = false;
    }
}
