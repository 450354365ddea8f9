#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>

#include <ft2build.h>
#include FT_FREETYPE_H
#include <opencv2/opencv.hpp>


// Minimal UTF-8 to Unicode codepoint decoder
inline std::vector<uint32_t> utf8_to_codepoints(const std::string& utf8) {
    std::vector<uint32_t> codepoints;
    size_t i = 0;
    while (i < utf8.size()) {
        unsigned char c = utf8[i];
        size_t len = c < 0x80 ? 1 : (c & 0xE0) == 0xC0 ? 2 : (c & 0xF0) == 0xE0 ? 3 : (c & 0xF8) == 0xF0 ? 4 : 1;
        if (i + len > utf8.size()) {
            break;
        }

        uint32_t cp = len == 1 ? c : len == 2 ? (c & 0x1F) : len == 3 ? (c & 0x0F) : (c & 0x07);
        for (size_t k = 1; k < len; ++k) {
            cp = (cp << 6) | (utf8[i + k] & 0x3F);
        }

        codepoints.push_back(cp);
        i += len;
    }
    return codepoints;
}


// Draws text with FreeType; falls back to Hershey fonts when the face is missing
class FT2TextRenderer {
public:
    explicit FT2TextRenderer(const std::string& font_path, int font_height = 32) : font_height(font_height) {
        if (FT_Init_FreeType(&ftlib) != 0) {
            ftlib = nullptr;
            std::cerr << "FreeType initialisation failed, using built-in font" << std::endl;
            return;
        }

        if (FT_New_Face(ftlib, font_path.c_str(), 0, &face) != 0) {
            face = nullptr;
            std::cerr << "Font not found: " << font_path << ", using built-in font" << std::endl;
            return;
        }
        FT_Set_Pixel_Sizes(face, 0, font_height);
    }

    ~FT2TextRenderer() {
        if (face) FT_Done_Face(face);
        if (ftlib) FT_Done_FreeType(ftlib);
    }

    FT2TextRenderer(const FT2TextRenderer&) = delete;
    FT2TextRenderer& operator=(const FT2TextRenderer&) = delete;

    int text_width(const std::string& text) {
        if (!face) {
            int baseline = 0;
            return cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, font_height / 32.0, 2, &baseline).width;
        }

        int width = 0;
        for (auto cp : utf8_to_codepoints(text)) {
            if (FT_Load_Char(face, cp, FT_LOAD_DEFAULT)) continue;
            width += (face->glyph->advance.x >> 6);
        }
        return width;
    }

    // Draws UTF-8 text with its baseline at org.y, BGR color
    void draw_text(cv::Mat& img, const std::string& text, cv::Point org, cv::Scalar color, bool center = false) {
        if (center) {
            org.x -= text_width(text) / 2;
        }

        if (!face) {
            cv::putText(img, text, org, cv::FONT_HERSHEY_SIMPLEX, font_height / 32.0, color, 2, cv::LINE_AA);
            return;
        }

        int x = org.x;
        for (auto cp : utf8_to_codepoints(text)) {
            if (FT_Load_Char(face, cp, FT_LOAD_RENDER)) continue;

            FT_GlyphSlot slot = face->glyph;
            int y = org.y - slot->bitmap_top;
            int w = slot->bitmap.width, h = slot->bitmap.rows;

            for (int row = 0; row < h; ++row) {
                for (int col = 0; col < w; ++col) {
                    int px = x + slot->bitmap_left + col;
                    int py = y + row;

                    if (px < 0 || py < 0 || px >= img.cols || py >= img.rows) {
                        continue;
                    }

                    uchar alpha = slot->bitmap.buffer[row * slot->bitmap.pitch + col];
                    cv::Vec3b& dst = img.at<cv::Vec3b>(py, px);
                    for (int c = 0; c < 3; ++c) {
                        dst[c] = static_cast<uchar>((dst[c] * (255 - alpha) + color[c] * alpha) / 255);
                    }
                }
            }
            x += (slot->advance.x >> 6);
        }
    }

private:
    FT_Library ftlib = nullptr;
    FT_Face face = nullptr;
    int font_height = 32;
};
