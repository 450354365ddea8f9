#include "session.hpp"

#include "settings.hpp"
#include "topology.hpp"
#include "placement.hpp"

#include <chrono>
#include <utility>
#include <iostream>
#include <stdexcept>
#include <algorithm>


PuzzleSession::PuzzleSession(FeedbackSink& feedback, SolvedPolicy policy) : feedback(feedback), completion(policy) {
}

PuzzleSession::~PuzzleSession() {
    supersede();
    // std::async futures join on destruction; the cancel flags keep that short
}

const std::vector<Piece>& PuzzleSession::regenerate(const cv::Mat& image, const PuzzleConfig& config, cv::Size canvas, uint64_t seed) {
    supersede();
    install(Assembler::assemble(image, config, canvas, seed));
    return puzzle.pieces;
}

uint64_t PuzzleSession::request_regenerate(const cv::Mat& image, const PuzzleConfig& config, cv::Size canvas, uint64_t seed) {
    supersede();
    drain_stale();

    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    cv::Mat source = image.clone();

    Pending request{ ++next_ticket, cancelled, {} };
    request.result = std::async(std::launch::async, [source, config, canvas, seed, cancelled]() {
        return Assembler::assemble(source, config, canvas, seed, cancelled.get());
    });

    pending = std::move(request);
    return pending->ticket;
}

void PuzzleSession::supersede() {
    if (!pending) {
        return;
    }

    pending->cancelled->store(true);
    stale.push_back(std::move(*pending));
    pending.reset();
}

void PuzzleSession::cancel() {
    supersede();
    drain_stale();
}

void PuzzleSession::drain_stale() {
    for (auto it = stale.begin(); it != stale.end();) {
        if (it->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ++it;
            continue;
        }

        try {
            it->result.get();
        }
        catch (const GenerationCancelled&) {
            // Expected for superseded requests
        }
        catch (const std::exception& e) {
            std::cerr << "Discarded failed stale generation #" << it->ticket << ": " << e.what() << std::endl;
        }
        it = stale.erase(it);
    }
}

bool PuzzleSession::poll() {
    drain_stale();

    if (!pending || pending->result.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
        return false;
    }

    Pending done = std::move(*pending);
    pending.reset();

    // get() rethrows generation errors; the displayed puzzle stays as it was
    install(done.result.get());
    return true;
}

bool PuzzleSession::wait() {
    if (!pending) {
        return false;
    }

    pending->result.wait();
    return poll();
}

void PuzzleSession::install(GeneratedPuzzle&& generated) {
    puzzle = std::move(generated);
    completion.reset();

    // An unshuffled puzzle is solved from the start
    completion.update(puzzle.pieces);
}

const Piece* PuzzleSession::find(const std::string& piece_id) const {
    auto it = std::find_if(puzzle.pieces.begin(), puzzle.pieces.end(), [&](const Piece& p) { return p.id == piece_id; });
    return it == puzzle.pieces.end() ? nullptr : &*it;
}

const Piece& PuzzleSession::evaluate_placement(const std::string& piece_id, const cv::Point2d& proposed) {
    auto it = std::find_if(puzzle.pieces.begin(), puzzle.pieces.end(), [&](const Piece& p) { return p.id == piece_id; });
    if (it == puzzle.pieces.end()) {
        throw std::out_of_range("No piece with id " + piece_id);
    }

    PlacementResult result = Placement::evaluate(*it, proposed);
    Placement::apply(*it, result);

    if (result.placed) {
        feedback.notify(FeedbackEvent::Snap);
    }

    if (completion.update(puzzle.pieces)) {
        feedback.notify(FeedbackEvent::Completion);
    }
    return *it;
}

nlohmann::json PuzzleSession::snapshot() const {
    nlohmann::json pieces = nlohmann::json::array();

    for (const auto& p : puzzle.pieces) {
        pieces.push_back({
            { "id", p.id },
            { "row", p.coord.row },
            { "col", p.coord.col },
            { "shape", {
                { "top", Topology::to_string(p.shape.top) },
                { "right", Topology::to_string(p.shape.right) },
                { "bottom", Topology::to_string(p.shape.bottom) },
                { "left", Topology::to_string(p.shape.left) },
            } },
            { "correct", { p.correct_position.x, p.correct_position.y } },
            { "current", { p.current_position.x, p.current_position.y } },
            { "width", p.width },
            { "height", p.height },
            { "placed", p.placed },
        });
    }

    return nlohmann::json{
        { "config", puzzle.config },
        { "seed", puzzle.seed },
        { "canvas", { { "width", puzzle.canvas.width }, { "height", puzzle.canvas.height } } },
        { "grid", { { "rows", puzzle.grid.rows }, { "cols", puzzle.grid.cols } } },
        { "solved", completion.solved() },
        { "elapsed_ms", completion.elapsed().count() },
        { "pieces", pieces },
    };
}

PuzzleSession::SavedProgress PuzzleSession::read_progress(const GeneratedPuzzle& target, const nlohmann::json& snapshot) {
    SavedProgress progress;
    try {
        const auto& grid = snapshot.at("grid");
        if (grid.at("rows").get<int>() != target.grid.rows || grid.at("cols").get<int>() != target.grid.cols) {
            throw ConfigError("Saved progress does not match the current puzzle grid");
        }

        for (const auto& saved : snapshot.at("pieces")) {
            std::string id = saved.at("id").get<std::string>();
            auto it = std::find_if(target.pieces.begin(), target.pieces.end(), [&](const Piece& p) { return p.id == id; });
            if (it == target.pieces.end()) {
                throw ConfigError("Saved progress names an unknown piece: " + id);
            }

            // Differing shapes mean the save came from another seed
            if (saved.contains("shape")) {
                const auto& shape = saved.at("shape");
                if (Topology::edge_from_string(shape.at("top").get<std::string>()) != it->shape.top ||
                    Topology::edge_from_string(shape.at("right").get<std::string>()) != it->shape.right ||
                    Topology::edge_from_string(shape.at("bottom").get<std::string>()) != it->shape.bottom ||
                    Topology::edge_from_string(shape.at("left").get<std::string>()) != it->shape.left) {
                    throw ConfigError("Saved progress has a different shape for piece " + id);
                }
            }

            const auto& current = saved.at("current");
            cv::Point2d position(current.at(0).get<double>(), current.at(1).get<double>());
            progress.pieces.push_back({ static_cast<size_t>(it - target.pieces.begin()), position, saved.at("placed").get<bool>() });
        }

        progress.solved = snapshot.value("solved", false);
        progress.elapsed = std::chrono::milliseconds(snapshot.value("elapsed_ms", int64_t{ 0 }));
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed saved progress: ") + e.what());
    }
    return progress;
}

void PuzzleSession::apply_progress(const SavedProgress& progress) {
    for (const auto& saved : progress.pieces) {
        Piece& piece = puzzle.pieces[saved.index];
        piece.current_position = saved.position;
        piece.placed = saved.placed;
    }
    completion.restore(progress.solved, progress.elapsed);
}

void PuzzleSession::restore(const nlohmann::json& snapshot) {
    apply_progress(read_progress(puzzle, snapshot));
}

void PuzzleSession::resume(const cv::Mat& image, const nlohmann::json& snapshot) {
    PuzzleConfig config;
    cv::Size canvas;
    uint64_t seed;

    try {
        config = snapshot.at("config").get<PuzzleConfig>();
        canvas = cv::Size(snapshot.at("canvas").at("width").get<int>(), snapshot.at("canvas").at("height").get<int>());
        seed = snapshot.at("seed").get<uint64_t>();
    }
    catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Malformed saved progress: ") + e.what());
    }

    // Build and check everything aside; the displayed puzzle changes only on success
    GeneratedPuzzle generated = Assembler::assemble(image, config, canvas, seed);
    SavedProgress progress = read_progress(generated, snapshot);

    supersede();
    install(std::move(generated));
    apply_progress(progress);
}
