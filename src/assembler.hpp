#pragma once

#include "main.hpp"
#include "topology.hpp"

#include <atomic>
#include <vector>
#include <cstdint>

#include <opencv2/opencv.hpp>


struct GeneratedPuzzle {
    PuzzleConfig config;
    GridSize grid;
    PieceMetrics metrics;
    cv::Size canvas;
    uint64_t seed;
    std::vector<Piece> pieces;
};

class Assembler {
public:
    // Full pipeline. Throws ConfigError, ImageLoadError, or GenerationCancelled
    // when *cancel becomes true; never returns a partial piece set.
    static GeneratedPuzzle assemble(const cv::Mat& image, const PuzzleConfig& config, cv::Size canvas, uint64_t seed, const std::atomic<bool>* cancel = nullptr);

    // Pieces in row-major order, positioned as solved
    static std::vector<Piece> generate(const cv::Mat& image, const EdgeTopology& topology, const PieceMetrics& metrics, const std::atomic<bool>* cancel = nullptr);

    static void shuffle(std::vector<Piece>& pieces, const cv::Size& canvas, cv::RNG& rng);
    static void arrange_solved(std::vector<Piece>& pieces);

    static cv::Size default_canvas(const cv::Size& image_size, const PieceMetrics& metrics);

    // Smallest board on which every piece can reach its correct position
    static cv::Size minimum_canvas(const GridSize& grid, const PieceMetrics& metrics);
    static void validate(const cv::Mat& image, const PuzzleConfig& config);
};
