#include "extractor.hpp"

#include "util.hpp"

#include <vector>


namespace {

// Sub-pixel precision for fillPoly/polylines
constexpr int FIXED_SHIFT = 4;
constexpr double FIXED_SCALE = 1 << FIXED_SHIFT;

std::vector<cv::Point> to_fixed(const std::vector<cv::Point2d>& points, int padding) {
    std::vector<cv::Point> fixed;
    fixed.reserve(points.size());

    for (const auto& p : points) {
        fixed.emplace_back(cvRound((p.x + padding) * FIXED_SCALE), cvRound((p.y + padding) * FIXED_SCALE));
    }
    return fixed;
}

}


cv::Mat Extractor::to_bgr(const cv::Mat& source) {
    cv::Mat bgr;
    switch (source.channels()) {
        case 1:  cv::cvtColor(source, bgr, cv::COLOR_GRAY2BGR); break;
        case 4:  cv::cvtColor(source, bgr, cv::COLOR_BGRA2BGR); break;
        default: bgr = source; break;
    }

    if (bgr.depth() != CV_8U) {
        bgr.convertTo(bgr, CV_8U);
    }
    return bgr;
}

cv::Mat Extractor::silhouette_mask(const PiecePath& path, const cv::Size& size, int padding) {
    cv::Mat mask = cv::Mat::zeros(size, CV_8UC1);
    std::vector<std::vector<cv::Point>> polys{ to_fixed(Silhouette::flatten(path), padding) };
    cv::fillPoly(mask, polys, cv::Scalar(255), cv::LINE_AA, FIXED_SHIFT);
    return mask;
}

cv::Mat Extractor::extract(const cv::Mat& source, const cv::Point& origin, int width, int height, const PiecePath& path, int padding, bool outline) {
    if (source.empty()) {
        throw ImageLoadError("Cannot extract a piece from an empty image");
    }
    if (width <= 0 || height <= 0 || padding < 0) {
        throw ConfigError("Piece dimensions must be positive");
    }

    const cv::Size size(width + 2 * padding, height + 2 * padding);
    const cv::Mat bgr = to_bgr(source);

    // Region of the source covered by the padded raster, clipped to what exists
    cv::Rect wanted(origin.x - padding, origin.y - padding, size.width, size.height);
    cv::Rect available = wanted & cv::Rect(0, 0, bgr.cols, bgr.rows);

    cv::Mat pixels = cv::Mat::zeros(size, CV_8UC3);
    cv::Mat coverage = cv::Mat::zeros(size, CV_8UC1);

    if (available.area() > 0) {
        cv::Rect dst(available.x - wanted.x, available.y - wanted.y, available.width, available.height);
        bgr(available).copyTo(pixels(dst));
        coverage(dst).setTo(cv::Scalar(255));
    }

    cv::Mat alpha = silhouette_mask(path, size, padding);
    cv::bitwise_and(alpha, coverage, alpha);

    if (outline) {
        cv::Mat stroked = pixels.clone();
        std::vector<std::vector<cv::Point>> polys{ to_fixed(Silhouette::flatten(path), padding) };
        cv::polylines(stroked, polys, true, cv::Scalar(255, 255, 255), 1, cv::LINE_AA, FIXED_SHIFT);
        cv::addWeighted(stroked, 0.35, pixels, 0.65, 0, pixels);
    }

    std::vector<cv::Mat> channels;
    cv::split(pixels, channels);
    channels.push_back(alpha);

    cv::Mat piece;
    cv::merge(channels, piece);
    return piece;
}

std::vector<uchar> Extractor::encode_png(const cv::Mat& piece) {
    std::vector<uchar> png;
    if (!cv::imencode(".png", piece, png)) {
        throw std::runtime_error("PNG encoding failed");
    }
    return png;
}

std::string Extractor::data_url(const std::vector<uchar>& png) {
    return "data:image/png;base64," + Util::base64_encode(png);
}
