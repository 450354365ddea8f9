#pragma once

#include "main.hpp"
#include "feedback.hpp"
#include "assembler.hpp"
#include "completion.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <nlohmann/json.hpp>
#include <opencv2/opencv.hpp>


// Owns the live piece collection. Only the assembler (through regenerate)
// and the placement evaluator write piece positions and placed flags.
class PuzzleSession {
public:
    explicit PuzzleSession(FeedbackSink& feedback, SolvedPolicy policy = SolvedPolicy::Sticky);
    ~PuzzleSession();

    PuzzleSession(const PuzzleSession&) = delete;
    PuzzleSession& operator=(const PuzzleSession&) = delete;

    // Blocking generation. On failure the previous puzzle is left untouched.
    const std::vector<Piece>& regenerate(const cv::Mat& image, const PuzzleConfig& config, cv::Size canvas, uint64_t seed);

    // Background generation. A newer request cancels and discards older ones.
    uint64_t request_regenerate(const cv::Mat& image, const PuzzleConfig& config, cv::Size canvas, uint64_t seed);

    // Installs the latest finished request. Rethrows its error, if any.
    bool poll();
    bool wait();
    void cancel();
    bool generating() const { return pending.has_value(); }

    const Piece& evaluate_placement(const std::string& piece_id, const cv::Point2d& proposed);
    bool is_solved() const { return completion.solved(); }

    const std::vector<Piece>& pieces() const { return puzzle.pieces; }
    const Piece* find(const std::string& piece_id) const;
    const GeneratedPuzzle& current() const { return puzzle; }
    const CompletionMonitor& monitor() const { return completion; }

    nlohmann::json snapshot() const;

    // Reapplies saved positions to the pieces of the same config and seed
    void restore(const nlohmann::json& snapshot);

    // Regenerates from the snapshot's config and seed, then restores it
    void resume(const cv::Mat& image, const nlohmann::json& snapshot);

private:
    struct SavedPiece {
        size_t index;
        cv::Point2d position;
        bool placed;
    };

    struct SavedProgress {
        std::vector<SavedPiece> pieces;
        bool solved;
        std::chrono::milliseconds elapsed;
    };

    // Checks the snapshot against target without touching it. Throws ConfigError.
    static SavedProgress read_progress(const GeneratedPuzzle& target, const nlohmann::json& snapshot);
    void apply_progress(const SavedProgress& progress);

    struct Pending {
        uint64_t ticket;
        std::shared_ptr<std::atomic<bool>> cancelled;
        std::future<GeneratedPuzzle> result;
    };

    void install(GeneratedPuzzle&& generated);
    void supersede();
    void drain_stale();

    FeedbackSink& feedback;
    CompletionMonitor completion;
    GeneratedPuzzle puzzle{};

    uint64_t next_ticket = 0;
    std::optional<Pending> pending;
    std::vector<Pending> stale;
};
