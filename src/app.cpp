#include "app.hpp"

#include "util.hpp"
#include "export.hpp"
#include "catalog.hpp"

#include <string>
#include <vector>
#include <utility>
#include <iostream>
#include <algorithm>
#include <filesystem>

#include <opencv2/opencv.hpp>


App::App(Settings settings, SessionStore& store, FeedbackSink& feedback)
    : settings(std::move(settings)), store(store), feedback(feedback), menu(std::make_unique<Menu>()),
      session(feedback, this->settings.solved_policy), ft2(FONT_FILE, 48), ft2_small(FONT_FILE, 28) {
}

App::~App() {
    session.cancel();
    cv::destroyAllWindows();
}

void App::on_mouse(int event, int x, int y, int, void* userdata) {
    if (userdata) {
        static_cast<App*>(userdata)->on_mouse_impl(event, x, y);
    }
}

const Piece* App::piece_at(const cv::Point& point) const {
    for (auto it = z_order.rbegin(); it != z_order.rend(); ++it) {
        const Piece* piece = session.find(*it);
        if (!piece) {
            continue;
        }

        int lx = point.x - cvRound(piece->current_position.x);
        int ly = point.y - cvRound(piece->current_position.y);
        if (lx < 0 || ly < 0 || lx >= piece->image.cols || ly >= piece->image.rows) {
            continue;
        }

        // Hit only on the silhouette, not the transparent padding
        if (piece->image.at<cv::Vec4b>(ly, lx)[3] > 0) {
            return piece;
        }
    }
    return nullptr;
}

void App::reset_z_order() {
    z_order.clear();
    for (const auto& piece : session.pieces()) {
        z_order.push_back(piece.id);
    }
}

void App::bring_to_front(const std::string& id) {
    auto it = std::find(z_order.begin(), z_order.end(), id);
    if (it != z_order.end()) {
        z_order.erase(it);
    }
    z_order.push_back(id);
}

void App::on_mouse_impl(int event, int x, int y) {
    if (session.generating() || session.pieces().empty()) {
        return;
    }

    if (event == cv::EVENT_LBUTTONDOWN) {
        if (session.is_solved() && session.monitor().policy() == SolvedPolicy::Sticky) {
            return;
        }

        const Piece* piece = piece_at(cv::Point(x, y));
        if (!piece) {
            return;
        }

        cv::Point2d grab(x - piece->current_position.x, y - piece->current_position.y);
        drag = Drag{ piece->id, grab, piece->current_position };
        bring_to_front(piece->id);
        feedback.notify(FeedbackEvent::Pickup);
        dirty = true;
    }
    else if (event == cv::EVENT_MOUSEMOVE && drag) {
        const Piece* piece = session.find(drag->id);
        if (!piece) {
            drag.reset();
            return;
        }

        const cv::Size& canvas = session.current().canvas;

        // Keep the whole raster on the board
        drag->position.x = Util::clamp(x - drag->grab_offset.x, 0.0, std::max(0.0, static_cast<double>(canvas.width - piece->width)));
        drag->position.y = Util::clamp(y - drag->grab_offset.y, 0.0, std::max(0.0, static_cast<double>(canvas.height - piece->height)));
        dirty = true;
    }
    else if (event == cv::EVENT_LBUTTONUP && drag) {
        session.evaluate_placement(drag->id, drag->position);
        drag.reset();
        dirty = true;
    }
}

void App::draw_piece(cv::Mat& canvas, const Piece& piece, const cv::Point2d& at) const {
    cv::Rect dst(cvRound(at.x), cvRound(at.y), piece.image.cols, piece.image.rows);
    cv::Rect clipped = dst & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (clipped.area() == 0) {
        return;
    }

    cv::Mat src = piece.image(cv::Rect(clipped.x - dst.x, clipped.y - dst.y, clipped.width, clipped.height));
    cv::Mat roi = canvas(clipped);

    for (int y = 0; y < roi.rows; ++y) {
        const cv::Vec4b* s = src.ptr<cv::Vec4b>(y);
        cv::Vec3b* d = roi.ptr<cv::Vec3b>(y);

        for (int x = 0; x < roi.cols; ++x) {
            int a = s[x][3];
            if (a == 0) {
                continue;
            }
            for (int c = 0; c < 3; ++c) {
                d[x][c] = static_cast<uchar>((s[x][c] * a + d[x][c] * (255 - a)) / 255);
            }
        }
    }
}

void App::draw_text_overlay(cv::Mat& mat, const std::string& line1, const std::string& line2) {
    int box_w = std::max(ft2.text_width(line1), ft2_small.text_width(line2)) + 60;
    int box_h = 48 + 28 + 60;
    int cx = mat.cols / 2;
    int box_y = mat.rows / 2 - box_h / 2;

    // Semi-transparent background box
    cv::Mat overlay = mat.clone();
    cv::rectangle(overlay, cv::Rect(cx - box_w / 2, box_y, box_w, box_h), cv::Scalar(0, 0, 0), cv::FILLED);
    cv::addWeighted(overlay, 0.6, mat, 0.4, 0, mat);

    int text1_y = box_y + 30 + 40;
    int text2_y = text1_y + 40;

    if (!line1.empty()) {
        ft2.draw_text(mat, line1, cv::Point(cx, text1_y), cv::Scalar(255, 255, 80), true);
    }
    if (!line2.empty()) {
        ft2_small.draw_text(mat, line2, cv::Point(cx, text2_y), cv::Scalar(255, 255, 255), true);
    }
}

void App::render() {
    const GeneratedPuzzle& puzzle = session.current();
    cv::Size size = puzzle.canvas.area() > 0 ? puzzle.canvas : cv::Size(WIN_W, WIN_H);
    cv::Mat canvas(size, CV_8UC3, cv::Scalar(40, 40, 40));

    // Frame where the assembled picture lands
    if (!puzzle.pieces.empty()) {
        const PieceMetrics& m = puzzle.metrics;
        cv::Rect frame(m.padding, m.padding, m.width * puzzle.grid.cols, m.height * puzzle.grid.rows);
        cv::rectangle(canvas, frame, cv::Scalar(90, 90, 90), 1, cv::LINE_AA);
    }

    for (const auto& id : z_order) {
        const Piece* piece = session.find(id);
        if (!piece) {
            continue;
        }

        cv::Point2d at = (drag && drag->id == id) ? drag->position : piece->current_position;
        draw_piece(canvas, *piece, at);
    }

    if (session.generating()) {
        draw_text_overlay(canvas, "Generating...", "");
    }
    else if (session.is_solved()) {
        draw_text_overlay(canvas, "Finito!", Util::format_duration(session.monitor().elapsed()) + "  -  Esc to return, R to play again");
    }

    if (!puzzle.pieces.empty()) {
        std::string progress = Util::format_progress(CompletionMonitor::placed_count(puzzle.pieces), static_cast<int>(puzzle.pieces.size()));
        ft2_small.draw_text(canvas, progress, cv::Point(canvas.cols - ft2_small.text_width(progress) - 12, 30), cv::Scalar(200, 200, 200));
    }

    if (!status.empty()) {
        ft2_small.draw_text(canvas, status, cv::Point(12, canvas.rows - 12), cv::Scalar(200, 200, 200));
    }

    cv::imshow(WIN_NAME, canvas);
    dirty = false;
}

void App::handle_key(int key, const cv::Mat& image, const std::string& save_key) {
    switch (key) {
        case 'r': case 'R':
            drag.reset();
            session.request_regenerate(image, settings.config, settings.canvas, settings.resolve_seed());
            status.clear();
            break;

        case 'p': case 'P':
            State::save_progress(store, save_key, session);
            status = "Progress saved";
            break;

        case 'l': case 'L': {
            auto snapshot = State::load_progress(store, save_key);
            if (!snapshot) {
                status = "No saved progress";
                break;
            }

            drag.reset();
            session.resume(image, *snapshot);
            reset_z_order();
            status = "Progress loaded";
            break;
        }

        default:
            return;
    }
    dirty = true;
}

void App::play(const cv::Mat& image, const std::string& key) {
    drag.reset();
    status.clear();
    z_order.clear();
    session.request_regenerate(image, settings.config, settings.canvas, settings.resolve_seed());

    cv::namedWindow(WIN_NAME, cv::WINDOW_AUTOSIZE);
    cv::setMouseCallback(WIN_NAME, App::on_mouse, this);
    render();

    while (true) {
        try {
            if (session.poll()) {
                reset_z_order();
                dirty = true;
            }
        }
        catch (const std::exception& e) {
            // The previous board stays up; report and keep the loop alive
            std::cerr << "Puzzle generation failed: " << e.what() << std::endl;
            status = "Generation failed";
            dirty = true;
        }

        if (dirty) {
            render();
        }

        int k = cv::waitKey(15);
        if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) < 1 || k == 27) {
            break;
        }

        try {
            handle_key(k, image, key);
        }
        catch (const std::exception& e) {
            std::cerr << "Progress error: " << e.what() << std::endl;
            status = e.what();
            dirty = true;
        }
    }

    session.cancel();
    drag.reset();
    if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) >= 1) {
        cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
    }
}

int App::run(const std::string& image_path) {
    std::vector<std::string> titles, keys;
    std::vector<cv::Mat> previews;

    if (!image_path.empty()) {
        previews.push_back(Catalog::load_file(image_path));
        titles.push_back(std::filesystem::path(image_path).filename().string());
        keys.push_back(settings.session_key);
    }
    else {
        for (const auto& entry : Catalog::load_meta(PUZZLE_META_FILE)) {
            try {
                previews.push_back(Catalog::load_image(PUZZLE_DATA_FILE, entry));
                titles.push_back(entry.artist.empty() ? entry.name : entry.name + " - " + entry.artist);
                keys.push_back(entry.name + "|" + entry.artist);
            }
            catch (const ImageLoadError& e) {
                std::cerr << "Skipping catalog entry: " << e.what() << std::endl;
            }
        }
    }

    if (previews.empty()) {
        std::cerr << "No puzzles found in " << PUZZLE_DATA_FILE << std::endl;
        return 1;
    }

    int page = 0;
    while (true) {
        MenuChoice choice = menu->show(titles, previews, page, settings.config);
        if (choice.pick < 0 || choice.pick >= static_cast<int>(previews.size())) {
            break;
        }

        page = choice.pick;
        settings.config = choice.config;
        settings.save(SETTINGS_FILE);

        play(previews[page], keys[page]);
    }

    cv::destroyAllWindows();
    return 0;
}

int App::export_pieces(const Settings& settings, const std::string& image_path, const std::string& dir) {
    NullFeedback quiet;
    PuzzleSession session(quiet, settings.solved_policy);

    uint64_t seed = settings.resolve_seed();
    session.regenerate(Catalog::load_file(image_path), settings.config, settings.canvas, seed);
    Exporter::write(dir, session);

    const GeneratedPuzzle& puzzle = session.current();
    std::cout << "Wrote " << puzzle.pieces.size() << " pieces (" << puzzle.grid.rows << "x" << puzzle.grid.cols << ", seed " << seed << ") to " << dir << std::endl;
    return 0;
}
