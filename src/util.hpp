#pragma once

#include <cmath>
#include <string>
#include <vector>
#include <cstdint>
#include <chrono>
#include <algorithm>

#include <opencv2/opencv.hpp>

class Util {
public:
    template<typename T>
    static constexpr T clamp(const T& v, const T& lo, const T& hi) {
        return (v < lo) ? lo : (v > hi) ? hi : v;
    }

    static double distance(const cv::Point2d& a, const cv::Point2d& b) {
        return std::hypot(b.x - a.x, b.y - a.y);
    }

    static bool is_near(const cv::Point2d& position, const cv::Point2d& target, double threshold) {
        return distance(position, target) < threshold;
    }

    // M:SS
    static std::string format_duration(std::chrono::milliseconds elapsed) {
        long long seconds = elapsed.count() / 1000;
        long long minutes = seconds / 60;
        long long rest = seconds % 60;
        return std::to_string(minutes) + ":" + (rest < 10 ? "0" : "") + std::to_string(rest);
    }

    // "N / M pieces (P%)"
    static std::string format_progress(int placed, int total) {
        int percent = total > 0 ? static_cast<int>(std::lround(placed * 100.0 / total)) : 0;
        return std::to_string(placed) + " / " + std::to_string(total) + " pieces (" + std::to_string(percent) + "%)";
    }

    static std::string base64_encode(const std::vector<uchar>& data) {
        static constexpr const char* table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        std::string out;
        out.reserve(((data.size() + 2) / 3) * 4);

        size_t i = 0;
        for (; i + 2 < data.size(); i += 3) {
            uint32_t n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
            out.push_back(table[(n >> 18) & 0x3F]);
            out.push_back(table[(n >> 12) & 0x3F]);
            out.push_back(table[(n >> 6) & 0x3F]);
            out.push_back(table[n & 0x3F]);
        }

        if (i + 1 == data.size()) {
            uint32_t n = data[i] << 16;
            out.push_back(table[(n >> 18) & 0x3F]);
            out.push_back(table[(n >> 12) & 0x3F]);
            out.append("==");
        }
        else if (i + 2 == data.size()) {
            uint32_t n = (data[i] << 16) | (data[i + 1] << 8);
            out.push_back(table[(n >> 18) & 0x3F]);
            out.push_back(table[(n >> 12) & 0x3F]);
            out.push_back(table[(n >> 6) & 0x3F]);
            out.push_back('=');
        }
        return out;
    }
};
