#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <stdexcept>

#include <opencv2/opencv.hpp>

constexpr const char* WIN_NAME = "Jigsaw";
constexpr const char* FONT_FILE = "res/NotoSansJP-Regular.ttf";
constexpr const char* SETTINGS_FILE = "res/settings.json";
constexpr const char* SESSION_DIR = "res/sessions";
constexpr const char* PUZZLE_DATA_FILE = "res/puzzles.dat";
constexpr const char* PUZZLE_META_FILE = "res/puzzles.json";

constexpr int MIN_PIECE_COUNT = 6;
constexpr int MAX_PIECE_COUNT = 300;

constexpr int EASY_PIECE_COUNT = 12;
constexpr int MEDIUM_PIECE_COUNT = 48;
constexpr int HARD_PIECE_COUNT = 120;

// Tab depth as a fraction of the nominal piece width
constexpr double TAB_SIZE_RATIO = 0.2;

// Upper bound on tab depth as a fraction of the nominal piece height
constexpr double TAB_HEIGHT_CAP_RATIO = 0.4;

// Snap distance in board pixels, independent of piece size
constexpr double SNAP_THRESHOLD = 20.0;

// Extra margin around the tab so the outline stroke is never cut off
constexpr int OUTLINE_MARGIN = 2;


class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

class ImageLoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class GenerationCancelled : public std::runtime_error {
public:
    GenerationCancelled() : std::runtime_error("Generation superseded by a newer request") {}
};


enum class Difficulty { Easy, Medium, Hard, Custom };

enum class EdgeType { Flat, Tab, Blank };

enum class SolvedPolicy { Sticky, Revert };

struct GridSize {
    int rows;
    int cols;
};

struct PieceCoord {
    int row;
    int col;
};

struct PieceShape {
    EdgeType top = EdgeType::Flat;
    EdgeType right = EdgeType::Flat;
    EdgeType bottom = EdgeType::Flat;
    EdgeType left = EdgeType::Flat;
};

struct PuzzleConfig {
    Difficulty difficulty = Difficulty::Medium;
    int piece_count = MEDIUM_PIECE_COUNT;
    bool shuffled = true;
};

// Positions are the top-left corner of the padded raster on the board.
struct Piece {
    std::string id;
    PieceCoord coord;
    PieceShape shape;

    cv::Point2d correct_position;
    cv::Point2d current_position;

    cv::Mat image;                  // BGRA, alpha is the silhouette mask
    std::vector<uchar> png;

    int width = 0, height = 0;      // padded raster size
    int padding = 0;
    bool placed = false;
};

struct PieceMetrics {
    int width, height;              // nominal
    int padding;
    double tab_size;
};
