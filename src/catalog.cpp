#include "catalog.hpp"

#include "main.hpp"

#include <string>
#include <vector>
#include <fstream>
#include <algorithm>

#include <zlib.h>
#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>


std::vector<CatalogEntry> Catalog::load_meta(const std::string& json_path) {
    std::ifstream f(json_path);
    if (!f) {
        throw ImageLoadError("Failed to open catalog file: " + json_path);
    }

    std::vector<CatalogEntry> entries;
    try {
        nlohmann::json j;
        f >> j;

        for (const auto& entry : j.at("puzzles")) {
            entries.push_back({
                entry.at("name").get<std::string>(),
                entry.value("artist", ""),
                entry.at("offset").get<int>(),
                entry.at("length").get<int>(),
            });
        }
    }
    catch (const nlohmann::json::exception& e) {
        throw ImageLoadError("Malformed catalog " + json_path + ": " + e.what());
    }
    return entries;
}

std::vector<uchar> Catalog::inflate(const std::vector<uchar>& compressed, size_t size_hint) {
    // Grow the output buffer until the stream fits
    uLongf capacity = static_cast<uLongf>(std::max<size_t>(size_hint, 1024));
    std::vector<uchar> out;

    for (int attempt = 0; attempt < 6; ++attempt) {
        out.resize(capacity);
        uLongf size = capacity;
        int z_result = uncompress(out.data(), &size, compressed.data(), static_cast<uLong>(compressed.size()));

        if (z_result == Z_OK) {
            out.resize(size);
            return out;
        }
        if (z_result != Z_BUF_ERROR) {
            throw ImageLoadError("zlib inflate failed with code " + std::to_string(z_result));
        }
        capacity *= 2;
    }

    throw ImageLoadError("Compressed image is larger than expected");
}

cv::Mat Catalog::load_image(const std::string& dat_path, const CatalogEntry& entry) {
    std::ifstream dat(dat_path, std::ios::binary);
    if (!dat) {
        throw ImageLoadError("Failed to open data file: " + dat_path);
    }

    dat.seekg(entry.offset);
    std::vector<uchar> compressed(entry.length);
    if (!dat.read(reinterpret_cast<char*>(compressed.data()), entry.length)) {
        throw ImageLoadError("Failed to read compressed data for: " + entry.name);
    }

    cv::Mat image = cv::imdecode(inflate(compressed, static_cast<size_t>(entry.length) * 20), cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageLoadError("Failed to decode image for: " + entry.name);
    }
    return image;
}

cv::Mat Catalog::load_file(const std::string& path) {
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw ImageLoadError("Failed to load image: " + path);
    }
    return image;
}
