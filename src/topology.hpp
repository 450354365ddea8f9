#pragma once

#include "main.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


// Row-major rows x cols matrix of piece shapes
struct EdgeTopology {
    GridSize grid;
    std::vector<PieceShape> shapes;

    const PieceShape& at(int row, int col) const { return shapes[row * grid.cols + col]; }
    PieceShape& at(int row, int col) { return shapes[row * grid.cols + col]; }
};

class Topology {
public:
    // Boundary edges stay flat; every shared edge gets one tab and one blank
    static EdgeTopology generate(const GridSize& grid, cv::RNG& rng);

    static bool is_complementary(EdgeType a, EdgeType b);
    static const char* to_string(EdgeType type);
    static EdgeType edge_from_string(const std::string& name);
};
