#include "completion.hpp"

#include <algorithm>


CompletionMonitor::CompletionMonitor(SolvedPolicy policy) : solved_policy(policy), started(Clock::now()) {
}

void CompletionMonitor::reset() {
    is_solved = false;
    completed.reset();
    started = Clock::now();
}

bool CompletionMonitor::all_placed(const std::vector<Piece>& pieces) {
    return !pieces.empty() && std::all_of(pieces.begin(), pieces.end(), [](const Piece& p) { return p.placed; });
}

int CompletionMonitor::placed_count(const std::vector<Piece>& pieces) {
    return static_cast<int>(std::count_if(pieces.begin(), pieces.end(), [](const Piece& p) { return p.placed; }));
}

bool CompletionMonitor::update(const std::vector<Piece>& pieces) {
    bool placed = all_placed(pieces);

    if (is_solved) {
        if (!placed && solved_policy == SolvedPolicy::Revert) {
            is_solved = false;
            completed.reset();
        }
        return false;
    }

    if (!placed) {
        return false;
    }

    is_solved = true;
    completed = Clock::now();
    return true;
}

void CompletionMonitor::restore(bool solved, std::chrono::milliseconds elapsed) {
    Clock::time_point now = Clock::now();
    started = now - elapsed;
    is_solved = solved;

    if (solved) {
        completed = now;
    }
    else {
        completed.reset();
    }
}

std::chrono::milliseconds CompletionMonitor::elapsed() const {
    Clock::time_point end = completed.value_or(Clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started);
}
