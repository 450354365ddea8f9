#pragma once

#include "main.hpp"
#include "silhouette.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


class Extractor {
public:
    // Returns a BGRA raster of (width + 2*padding) x (height + 2*padding).
    // Pixels outside the silhouette or outside the source are transparent.
    static cv::Mat extract(const cv::Mat& source, const cv::Point& origin, int width, int height, const PiecePath& path, int padding, bool outline = true);

    static cv::Mat silhouette_mask(const PiecePath& path, const cv::Size& size, int padding);

    static std::vector<uchar> encode_png(const cv::Mat& piece);
    static std::string data_url(const std::vector<uchar>& png);

private:
    static cv::Mat to_bgr(const cv::Mat& source);
};
