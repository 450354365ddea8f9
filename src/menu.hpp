#pragma once

#include "ft2.hpp"
#include "main.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

// Layout constants
constexpr int WIN_W = 900;
constexpr int WIN_H = 700;
constexpr int MARGIN = 20;
constexpr int BTN_W = 60;
constexpr int BTN_H = 120;
constexpr int NAV_FONT_HEIGHT = 36;
constexpr int CUSTOM_STEP = 6;

struct MenuLayout {
    int win_w, win_h;
    int margin;
    int thumb_w, thumb_h;
    int nav_y, y_offset;
    int draw_w, draw_h, img_x, img_y;
    int btn_w, btn_h, btn_y;
    int left_btn_x, right_btn_x;
};

struct MenuCallbackState {
    MenuLayout layout;
    int page, total_pages;
    int selected = -1;
    int nav_dir = 0;
    std::string hover = "none";
};

struct MenuChoice {
    int pick;               // -1 when the user quits
    PuzzleConfig config;
};

class Menu {
public:
    Menu();
    MenuChoice show(const std::vector<std::string>& titles, const std::vector<cv::Mat>& previews, int page, PuzzleConfig config);

    static void on_mouse(int event, int x, int y, int flags, void* userdata);

    // Applies a settings key; returns false if the key is not a settings key
    static bool apply_key(int key, PuzzleConfig& config);

private:
    FT2TextRenderer ft2;
    FT2TextRenderer ft2_small;

private:
    void draw_arrow_btn(cv::Mat& canvas, int x, int y, int w, int h, bool hover, const std::string& arrow, const cv::Scalar& border_color, const cv::Scalar& hover_color, int border_thick, int hover_thick);

    void draw_config_info(cv::Mat& canvas, const std::string& title, const PuzzleConfig& config, const MenuLayout& layout);

    MenuLayout compute_menu_layout(const cv::Mat& preview);

    void draw_menu(const MenuLayout& layout, int idx, int total_pages, const std::string& hover, const std::vector<std::string>& titles, const std::vector<cv::Mat>& previews, const PuzzleConfig& config);
};
