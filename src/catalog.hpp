#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>


struct CatalogEntry {
    std::string name;
    std::string artist;

    int offset;
    int length;
};

class Catalog {
public:
    static std::vector<CatalogEntry> load_meta(const std::string& json_path);

    // Inflates and decodes one entry of the packed data file
    static cv::Mat load_image(const std::string& dat_path, const CatalogEntry& entry);

    static cv::Mat load_file(const std::string& path);

    static std::vector<uchar> inflate(const std::vector<uchar>& compressed, size_t size_hint);
};
