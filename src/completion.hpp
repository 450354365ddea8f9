#pragma once

#include "main.hpp"

#include <chrono>
#include <vector>
#include <optional>


class CompletionMonitor {
public:
    using Clock = std::chrono::system_clock;

    explicit CompletionMonitor(SolvedPolicy policy = SolvedPolicy::Sticky);

    // Starts a new run: clears the solved flag and stamps the start time
    void reset();

    // Returns true only on the call that moves the puzzle into the solved state
    bool update(const std::vector<Piece>& pieces);

    // Restores a saved state without raising a completion event
    void restore(bool solved, std::chrono::milliseconds elapsed);

    bool solved() const { return is_solved; }
    SolvedPolicy policy() const { return solved_policy; }
    std::optional<Clock::time_point> completed_at() const { return completed; }
    std::chrono::milliseconds elapsed() const;

    static bool all_placed(const std::vector<Piece>& pieces);
    static int placed_count(const std::vector<Piece>& pieces);

private:
    SolvedPolicy solved_policy;
    bool is_solved = false;
    Clock::time_point started;
    std::optional<Clock::time_point> completed;
};
