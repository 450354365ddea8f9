#pragma once

#include "ft2.hpp"
#include "main.hpp"
#include "menu.hpp"
#include "state.hpp"
#include "session.hpp"
#include "feedback.hpp"
#include "settings.hpp"

#include <memory>
#include <string>
#include <vector>
#include <optional>

#include <opencv2/opencv.hpp>


class App {
public:
    App(Settings settings, SessionStore& store, FeedbackSink& feedback);
    ~App();

    // Menu and board loop; an empty path browses the bundled catalog
    int run(const std::string& image_path);

    // Headless: writes every piece and a manifest into dir
    static int export_pieces(const Settings& settings, const std::string& image_path, const std::string& dir);

    // OpenCV callback as static wrapper
    static void on_mouse(int event, int x, int y, int flags, void* userdata);

private:
    struct Drag {
        std::string id;
        cv::Point2d grab_offset;
        cv::Point2d position;
    };

    void on_mouse_impl(int event, int x, int y);
    void play(const cv::Mat& image, const std::string& key);
    void handle_key(int key, const cv::Mat& image, const std::string& save_key);
    void render();

    void draw_piece(cv::Mat& canvas, const Piece& piece, const cv::Point2d& at) const;
    void draw_text_overlay(cv::Mat& mat, const std::string& line1, const std::string& line2);
    const Piece* piece_at(const cv::Point& point) const;
    void reset_z_order();
    void bring_to_front(const std::string& id);

    Settings settings;
    SessionStore& store;
    FeedbackSink& feedback;

    std::unique_ptr<Menu> menu;
    PuzzleSession session;
    FT2TextRenderer ft2;
    FT2TextRenderer ft2_small;

    std::vector<std::string> z_order;   // back to front
    std::optional<Drag> drag;
    std::string status;
    bool dirty = true;
};
