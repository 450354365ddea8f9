#include "completion.hpp"

#include "util.hpp"

#include <gtest/gtest.h>


namespace {

std::vector<Piece> make_pieces(int n, bool placed) {
    std::vector<Piece> pieces(n);
    for (int i = 0; i < n; ++i) {
        pieces[i].id = "piece-0-" + std::to_string(i);
        pieces[i].placed = placed;
    }
    return pieces;
}

}


TEST(completion, emptyCollectionIsNotSolved) {
    CompletionMonitor monitor;
    EXPECT_FALSE(monitor.update({}));
    EXPECT_FALSE(monitor.solved());
    EXPECT_FALSE(CompletionMonitor::all_placed({}));
}

TEST(completion, firesOnceOnTransition) {
    CompletionMonitor monitor;
    std::vector<Piece> pieces = make_pieces(4, false);

    EXPECT_FALSE(monitor.update(pieces));
    for (int i = 0; i < 3; ++i) {
        pieces[i].placed = true;
        EXPECT_FALSE(monitor.update(pieces));
    }

    pieces[3].placed = true;
    EXPECT_TRUE(monitor.update(pieces));
    EXPECT_TRUE(monitor.solved());
    ASSERT_TRUE(monitor.completed_at().has_value());

    EXPECT_FALSE(monitor.update(pieces));
    EXPECT_FALSE(monitor.update(pieces));
}

TEST(completion, stickyStaysSolved) {
    CompletionMonitor monitor(SolvedPolicy::Sticky);
    std::vector<Piece> pieces = make_pieces(3, true);
    ASSERT_TRUE(monitor.update(pieces));

    pieces[1].placed = false;
    EXPECT_FALSE(monitor.update(pieces));
    EXPECT_TRUE(monitor.solved());

    pieces[1].placed = true;
    EXPECT_FALSE(monitor.update(pieces));
}

TEST(completion, revertReopensAndFiresAgain) {
    CompletionMonitor monitor(SolvedPolicy::Revert);
    std::vector<Piece> pieces = make_pieces(3, true);
    ASSERT_TRUE(monitor.update(pieces));

    pieces[0].placed = false;
    EXPECT_FALSE(monitor.update(pieces));
    EXPECT_FALSE(monitor.solved());
    EXPECT_FALSE(monitor.completed_at().has_value());

    pieces[0].placed = true;
    EXPECT_TRUE(monitor.update(pieces));
    EXPECT_TRUE(monitor.solved());
}

TEST(completion, resetStartsOver) {
    CompletionMonitor monitor;
    std::vector<Piece> pieces = make_pieces(2, true);
    ASSERT_TRUE(monitor.update(pieces));

    monitor.reset();
    EXPECT_FALSE(monitor.solved());
    EXPECT_TRUE(monitor.update(pieces));
}

TEST(completion, elapsedFreezesAtCompletion) {
    CompletionMonitor monitor;
    monitor.restore(false, std::chrono::milliseconds(65000));
    EXPECT_GE(monitor.elapsed().count(), 65000);

    std::vector<Piece> pieces = make_pieces(1, true);
    ASSERT_TRUE(monitor.update(pieces));

    auto frozen = monitor.elapsed();
    EXPECT_EQ(monitor.elapsed(), frozen);
}

TEST(completion, restoreDoesNotFire) {
    CompletionMonitor monitor;
    monitor.restore(true, std::chrono::milliseconds(1000));
    EXPECT_TRUE(monitor.solved());

    std::vector<Piece> pieces = make_pieces(2, true);
    EXPECT_FALSE(monitor.update(pieces));
}

TEST(completion, durationFormat) {
    EXPECT_EQ(Util::format_duration(std::chrono::milliseconds(0)), "0:00");
    EXPECT_EQ(Util::format_duration(std::chrono::milliseconds(65999)), "1:05");
    EXPECT_EQ(Util::format_duration(std::chrono::milliseconds(600000)), "10:00");
}

TEST(completion, countsPlacedPieces) {
    std::vector<Piece> pieces = make_pieces(5, false);
    EXPECT_EQ(CompletionMonitor::placed_count(pieces), 0);
    EXPECT_EQ(CompletionMonitor::placed_count({}), 0);

    pieces[0].placed = true;
    pieces[3].placed = true;
    EXPECT_EQ(CompletionMonitor::placed_count(pieces), 2);
    EXPECT_EQ(Util::format_progress(CompletionMonitor::placed_count(pieces), 5), "2 / 5 pieces (40%)");

    for (auto& p : pieces) {
        p.placed = true;
    }
    EXPECT_EQ(CompletionMonitor::placed_count(pieces), 5);
    EXPECT_EQ(Util::format_progress(5, 5), "5 / 5 pieces (100%)");
    EXPECT_EQ(Util::format_progress(0, 0), "0 / 0 pieces (0%)");
    EXPECT_EQ(Util::format_progress(2, 3), "2 / 3 pieces (67%)");
}
