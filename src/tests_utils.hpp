#pragma once

#include "main.hpp"

#include <string>
#include <random>
#include <filesystem>

#include <opencv2/opencv.hpp>


// Every pixel encodes its own coordinates, so copies can be checked exactly
inline cv::Mat make_test_image(int width, int height) {
    cv::Mat image(height, width, CV_8UC3);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image.at<cv::Vec3b>(y, x) = cv::Vec3b(static_cast<uchar>(x % 256), static_cast<uchar>(y % 256), static_cast<uchar>((x / 256) * 16 + y / 256));
        }
    }
    return image;
}

inline PuzzleConfig make_config(Difficulty difficulty, bool shuffled, int piece_count = MEDIUM_PIECE_COUNT) {
    PuzzleConfig config;
    config.difficulty = difficulty;
    config.piece_count = piece_count;
    config.shuffled = shuffled;
    return config;
}

inline std::filesystem::path make_temp_dir(const std::string& name) {
    std::random_device rd;
    std::filesystem::path dir = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}
