#include "menu.hpp"

#include "grid.hpp"
#include "util.hpp"
#include "settings.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


Menu::Menu() : ft2(FONT_FILE), ft2_small(FONT_FILE, 22) {}

// Helper to draw an arrow button (left/right)
void Menu::draw_arrow_btn(cv::Mat& canvas, int x, int y, int w, int h, bool hover, const std::string& arrow, const cv::Scalar& border_color, const cv::Scalar& hover_color, int border_thick, int hover_thick) {
    cv::Scalar color = hover ? hover_color : border_color;
    int thick = hover ? hover_thick : border_thick;

    cv::rectangle(canvas, cv::Rect(x, y, w, h), color, cv::FILLED);
    cv::rectangle(canvas, cv::Rect(x, y, w, h), color, thick);
    ft2.draw_text(canvas, arrow, cv::Point(x + w / 2, y + h / 2 + 12), cv::Scalar(255, 255, 255), true);
}

void Menu::draw_config_info(cv::Mat& canvas, const std::string& title, const PuzzleConfig& config, const MenuLayout& layout) {
    int center_x = layout.win_w / 2;
    int info_y = layout.y_offset + layout.thumb_h + 50;

    ft2.draw_text(canvas, title, cv::Point(center_x, info_y), cv::Scalar(255, 255, 255), true);

    int count = Grid::piece_count_for(config);
    GridSize grid = Grid::plan(count);
    std::string summary = std::to_string(grid.rows * grid.cols) + " pieces (" + std::to_string(grid.rows) + "x" + std::to_string(grid.cols) + "), " + (config.shuffled ? "shuffled" : "in place");
    ft2_small.draw_text(canvas, summary, cv::Point(center_x, info_y + 40), cv::Scalar(200, 200, 200), true);

    cv::Scalar diff_color(0, 255, 0);
    if (config.difficulty == Difficulty::Medium) {
        diff_color = cv::Scalar(0, 255, 255);
    }
    else if (config.difficulty == Difficulty::Hard) {
        diff_color = cv::Scalar(0, 0, 255);
    }
    else if (config.difficulty == Difficulty::Custom) {
        diff_color = cv::Scalar(255, 180, 80);
    }

    std::string difficulty = Settings::to_string(config.difficulty);
    ft2.draw_text(canvas, difficulty, cv::Point(layout.win_w - ft2.text_width(difficulty) - 40, layout.win_h - 30), diff_color);
    ft2_small.draw_text(canvas, "1-4 difficulty   +/- pieces   S shuffle   Enter play", cv::Point(30, layout.win_h - 30), cv::Scalar(160, 160, 160));
}

MenuLayout Menu::compute_menu_layout(const cv::Mat& preview) {
    MenuLayout layout {
        .win_w = WIN_W,
        .win_h = WIN_H,
        .margin = MARGIN,
        .thumb_w = WIN_W - 2 * MARGIN - 2 * BTN_W,
        .thumb_h = WIN_H - 220,
        .nav_y = MARGIN + NAV_FONT_HEIGHT / 2,
        .y_offset = MARGIN + NAV_FONT_HEIGHT,
    };

    int area_x = layout.margin + BTN_W;
    int area_y = layout.y_offset;
    double aspect = static_cast<double>(preview.cols) / preview.rows;

    // Fit the preview inside the thumbnail area
    int draw_w = layout.thumb_w;
    int draw_h = static_cast<int>(draw_w / aspect);
    if (draw_h > layout.thumb_h) {
        draw_h = layout.thumb_h;
        draw_w = static_cast<int>(draw_h * aspect);
    }

    layout.draw_w = draw_w;
    layout.draw_h = draw_h;
    layout.img_x = area_x + (layout.thumb_w - draw_w) / 2;
    layout.img_y = area_y + (layout.thumb_h - draw_h) / 2;
    layout.btn_w = BTN_W;
    layout.btn_h = BTN_H;
    layout.btn_y = area_y + (layout.thumb_h - layout.btn_h) / 2;
    layout.left_btn_x = layout.margin;
    layout.right_btn_x = layout.win_w - layout.margin - layout.btn_w;
    return layout;
}

void Menu::draw_menu(const MenuLayout& layout, int idx, int total_pages, const std::string& hover, const std::vector<std::string>& titles, const std::vector<cv::Mat>& previews, const PuzzleConfig& config) {
    cv::namedWindow(WIN_NAME, cv::WINDOW_AUTOSIZE);
    cv::Mat canvas(layout.win_h, layout.win_w, CV_8UC3, cv::Scalar(30, 30, 30));

    std::string nav = std::to_string(idx + 1) + "/" + std::to_string(total_pages);
    ft2.draw_text(canvas, nav, cv::Point(layout.win_w / 2, layout.nav_y), cv::Scalar(255, 255, 255), true);

    cv::Mat thumb;
    cv::resize(previews[idx], thumb, cv::Size(layout.draw_w, layout.draw_h));
    thumb.copyTo(canvas(cv::Rect(layout.img_x, layout.img_y, layout.draw_w, layout.draw_h)));

    cv::Scalar border_color(80, 140, 220);
    cv::Scalar hover_color(180, 220, 255);
    int border_thick = 4, hover_thick = 8;

    cv::Scalar img_border = (hover == "image") ? hover_color : border_color;
    int img_thick = (hover == "image") ? hover_thick : border_thick;
    cv::rectangle(canvas, cv::Rect(layout.img_x, layout.img_y, layout.draw_w, layout.draw_h), img_border, img_thick);

    if (total_pages > 1) {
        draw_arrow_btn(canvas, layout.left_btn_x, layout.btn_y, layout.btn_w, layout.btn_h, hover == "left", "<", border_color, hover_color, border_thick, hover_thick);
        draw_arrow_btn(canvas, layout.right_btn_x, layout.btn_y, layout.btn_w, layout.btn_h, hover == "right", ">", border_color, hover_color, border_thick, hover_thick);
    }

    draw_config_info(canvas, titles[idx], config, layout);
    cv::imshow(WIN_NAME, canvas);
}

void Menu::on_mouse(int event, int x, int y, int, void* userdata) {
    auto* state = static_cast<MenuCallbackState*>(userdata);
    if (!state) {
        return;
    }

    const MenuLayout& l = state->layout;
    const bool over_left  = state->total_pages > 1 && x >= l.left_btn_x && x < l.left_btn_x + l.btn_w && y >= l.btn_y && y < l.btn_y + l.btn_h;
    const bool over_right = state->total_pages > 1 && x >= l.right_btn_x && x < l.right_btn_x + l.btn_w && y >= l.btn_y && y < l.btn_y + l.btn_h;
    const bool over_image = x >= l.img_x && x < l.img_x + l.draw_w && y >= l.img_y && y < l.img_y + l.draw_h;

    std::string hover = "none";
    if (over_left)       hover = "left";
    else if (over_right) hover = "right";
    else if (over_image) hover = "image";

    if (event == cv::EVENT_MOUSEMOVE) {
        state->hover = hover;
        return;
    }

    if (event != cv::EVENT_LBUTTONDOWN) {
        return;
    }

    if (hover == "left") {
        state->nav_dir = -1;
    }
    else if (hover == "right") {
        state->nav_dir = 1;
    }
    else if (hover == "image") {
        state->selected = state->page;
    }
}

bool Menu::apply_key(int key, PuzzleConfig& config) {
    switch (key) {
        case '1': config.difficulty = Difficulty::Easy; return true;
        case '2': config.difficulty = Difficulty::Medium; return true;
        case '3': config.difficulty = Difficulty::Hard; return true;
        case '4': config.difficulty = Difficulty::Custom; return true;
        case 's': case 'S': config.shuffled = !config.shuffled; return true;
        case '+': case '=': case '-': {
            int base = config.difficulty == Difficulty::Custom ? config.piece_count : Grid::piece_count_for(config);
            int step = key == '-' ? -CUSTOM_STEP : CUSTOM_STEP;
            config.difficulty = Difficulty::Custom;
            config.piece_count = Util::clamp(base + step, MIN_PIECE_COUNT, MAX_PIECE_COUNT);
            return true;
        }
        default:
            return false;
    }
}

MenuChoice Menu::show(const std::vector<std::string>& titles, const std::vector<cv::Mat>& previews, int page, PuzzleConfig config) {
    int total_pages = static_cast<int>(previews.size());
    int current_page = Util::clamp(page, 0, total_pages - 1);

    while (true) {
        MenuCallbackState state{ compute_menu_layout(previews[current_page]), current_page, total_pages };
        std::string last_hover = state.hover;

        draw_menu(state.layout, current_page, total_pages, state.hover, titles, previews, config);
        cv::setMouseCallback(WIN_NAME, Menu::on_mouse, &state);

        while (state.selected == -1 && state.nav_dir == 0) {
            int key = cv::waitKey(15);
            if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) < 1 || key == 27) {
                cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
                return { -1, config };
            }

            if (key == 13 || key == 10 || key == ' ') {
                state.selected = current_page;
                break;
            }

            bool changed = apply_key(key, config);
            if (changed || state.hover != last_hover) {
                last_hover = state.hover;
                draw_menu(state.layout, current_page, total_pages, state.hover, titles, previews, config);
            }
        }

        cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
        if (state.selected != -1) {
            return { state.selected, config };
        }

        current_page = (current_page + state.nav_dir + total_pages) % total_pages;
    }
}
