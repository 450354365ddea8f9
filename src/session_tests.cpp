#include "session.hpp"

#include "state.hpp"
#include "tests_utils.hpp"

#include <gtest/gtest.h>


TEST(session, placingEveryPieceCompletesOnce) {
    RecordingFeedback feedback;
    PuzzleSession session(feedback);
    cv::Mat image = make_test_image(400, 300);

    session.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(900, 700), 21);
    ASSERT_EQ(session.pieces().size(), 12u);
    ASSERT_FALSE(session.is_solved());

    std::vector<std::pair<std::string, cv::Point2d>> targets;
    for (const auto& p : session.pieces()) {
        targets.emplace_back(p.id, p.correct_position);
    }

    for (const auto& [id, correct] : targets) {
        const Piece& placed = session.evaluate_placement(id, correct);
        EXPECT_TRUE(placed.placed);
    }

    EXPECT_TRUE(session.is_solved());
    EXPECT_EQ(feedback.count(FeedbackEvent::Snap), 12);
    EXPECT_EQ(feedback.count(FeedbackEvent::Completion), 1);

    // Dropping a piece back in place after completion does not fire again
    session.evaluate_placement(targets.front().first, targets.front().second);
    EXPECT_EQ(feedback.count(FeedbackEvent::Completion), 1);
}

TEST(session, nearDropSnapsFarDropDoesNot) {
    RecordingFeedback feedback;
    PuzzleSession session(feedback);
    session.regenerate(make_test_image(400, 300), make_config(Difficulty::Easy, true), cv::Size(900, 700), 4);

    const Piece& first = session.pieces().front();
    std::string id = first.id;
    cv::Point2d correct = first.correct_position;

    const Piece& near = session.evaluate_placement(id, correct + cv::Point2d(3, 4));
    EXPECT_EQ(near.current_position, correct);
    EXPECT_TRUE(near.placed);

    const Piece& far = session.evaluate_placement(id, correct + cv::Point2d(50, 0));
    EXPECT_EQ(far.current_position, correct + cv::Point2d(50, 0));
    EXPECT_FALSE(far.placed);

    EXPECT_EQ(feedback.count(FeedbackEvent::Snap), 1);
    EXPECT_EQ(feedback.count(FeedbackEvent::Completion), 0);
}

TEST(session, unshuffledPuzzleStartsSolved) {
    RecordingFeedback feedback;
    PuzzleSession session(feedback);
    session.regenerate(make_test_image(400, 300), make_config(Difficulty::Easy, false), cv::Size(0, 0), 1);

    EXPECT_TRUE(session.is_solved());
    EXPECT_TRUE(feedback.events.empty());
}

TEST(session, unknownPieceThrows) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    session.regenerate(make_test_image(400, 300), make_config(Difficulty::Easy, true), cv::Size(0, 0), 1);

    EXPECT_THROW(session.evaluate_placement("piece-9-9", cv::Point2d(0, 0)), std::out_of_range);
    EXPECT_EQ(session.find("piece-9-9"), nullptr);
    EXPECT_NE(session.find("piece-2-3"), nullptr);
}

TEST(session, failedRegenerateKeepsPreviousPuzzle) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    cv::Mat image = make_test_image(400, 300);
    session.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(0, 0), 8);

    cv::Point2d before = session.pieces().front().current_position;

    EXPECT_THROW(session.regenerate(image, make_config(Difficulty::Custom, true, 500), cv::Size(0, 0), 9), ConfigError);
    EXPECT_THROW(session.regenerate(cv::Mat(), make_config(Difficulty::Easy, true), cv::Size(0, 0), 9), ImageLoadError);

    ASSERT_EQ(session.pieces().size(), 12u);
    EXPECT_EQ(session.pieces().front().current_position, before);
    EXPECT_EQ(session.current().seed, 8u);
}

TEST(session, latestBackgroundRequestWins) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    cv::Mat image = make_test_image(400, 300);

    session.request_regenerate(image, make_config(Difficulty::Hard, true), cv::Size(0, 0), 100);
    uint64_t ticket = session.request_regenerate(image, make_config(Difficulty::Easy, true), cv::Size(0, 0), 200);
    EXPECT_EQ(ticket, 2u);
    EXPECT_TRUE(session.generating());

    EXPECT_TRUE(session.wait());
    EXPECT_FALSE(session.generating());
    EXPECT_EQ(session.current().seed, 200u);
    EXPECT_EQ(session.pieces().size(), 12u);

    // Nothing left to install
    EXPECT_FALSE(session.poll());
    EXPECT_FALSE(session.wait());
}

TEST(session, backgroundFailureSurfacesOnPoll) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    cv::Mat image = make_test_image(400, 300);
    session.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(0, 0), 5);

    session.request_regenerate(cv::Mat(), make_config(Difficulty::Easy, true), cv::Size(0, 0), 6);
    EXPECT_THROW(session.wait(), ImageLoadError);

    EXPECT_FALSE(session.generating());
    EXPECT_EQ(session.current().seed, 5u);
    EXPECT_EQ(session.pieces().size(), 12u);
}

TEST(session, cancelDropsPendingRequest) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    session.request_regenerate(make_test_image(400, 300), make_config(Difficulty::Easy, true), cv::Size(0, 0), 3);

    session.cancel();
    EXPECT_FALSE(session.generating());
    EXPECT_FALSE(session.wait());
    EXPECT_TRUE(session.pieces().empty());
}

TEST(session, snapshotResumesInFreshSession) {
    RecordingFeedback feedback;
    MemorySessionStore store;
    cv::Mat image = make_test_image(400, 300);

    PuzzleSession original(feedback);
    original.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(800, 600), 42);
    std::string moved = original.pieces()[2].id;
    cv::Point2d target = original.pieces()[2].correct_position;
    original.evaluate_placement(moved, target);
    original.evaluate_placement(original.pieces()[5].id, cv::Point2d(333, 222));

    State::save_progress(store, "game", original);
    std::optional<nlohmann::json> saved = State::load_progress(store, "game");
    ASSERT_TRUE(saved.has_value());

    PuzzleSession resumed(feedback);
    resumed.resume(image, *saved);

    ASSERT_EQ(resumed.pieces().size(), original.pieces().size());
    for (const auto& p : original.pieces()) {
        const Piece* q = resumed.find(p.id);
        ASSERT_NE(q, nullptr);
        EXPECT_EQ(q->current_position, p.current_position);
        EXPECT_EQ(q->placed, p.placed);
        EXPECT_EQ(q->correct_position, p.correct_position);
    }
    EXPECT_EQ(resumed.current().canvas, cv::Size(800, 600));
    EXPECT_FALSE(resumed.is_solved());
}

TEST(session, restoreRejectsMismatchedGrid) {
    NullFeedback feedback;
    cv::Mat image = make_test_image(400, 300);

    PuzzleSession easy(feedback);
    easy.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(0, 0), 1);
    nlohmann::json saved = easy.snapshot();

    PuzzleSession medium(feedback);
    medium.regenerate(image, make_config(Difficulty::Medium, true), cv::Size(0, 0), 1);
    cv::Point2d before = medium.pieces().front().current_position;

    EXPECT_THROW(medium.restore(saved), ConfigError);
    EXPECT_THROW(medium.restore(nlohmann::json{ { "grid", 3 } }), ConfigError);
    EXPECT_EQ(medium.pieces().front().current_position, before);
}

TEST(session, snapshotCarriesPieceData) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    session.regenerate(make_test_image(400, 300), make_config(Difficulty::Custom, true, 6), cv::Size(0, 0), 12);

    nlohmann::json snap = session.snapshot();
    EXPECT_EQ(snap.at("seed").get<uint64_t>(), 12u);
    EXPECT_EQ(snap.at("config").at("difficulty"), "custom");
    EXPECT_EQ(snap.at("config").at("piece_count"), 6);
    EXPECT_EQ(snap.at("grid").at("rows"), 2);
    EXPECT_EQ(snap.at("grid").at("cols"), 3);
    ASSERT_EQ(snap.at("pieces").size(), 6u);

    const auto& piece = snap.at("pieces").at(0);
    EXPECT_TRUE(piece.contains("id"));
    EXPECT_TRUE(piece.at("shape").contains("top"));
    EXPECT_EQ(piece.at("current").size(), 2u);
    EXPECT_FALSE(piece.at("placed").get<bool>());
}

TEST(session, badSaveLeavesBoardUntouched) {
    NullFeedback feedback;
    cv::Mat image = make_test_image(400, 300);

    PuzzleSession session(feedback);
    session.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(0, 0), 31);
    session.evaluate_placement(session.pieces()[0].id, session.pieces()[0].correct_position);

    std::vector<cv::Point2d> before;
    for (const auto& p : session.pieces()) {
        before.push_back(p.current_position);
    }

    // Save from another seed, with one id renamed
    PuzzleSession other(feedback);
    other.regenerate(image, make_config(Difficulty::Easy, true), cv::Size(0, 0), 32);
    nlohmann::json saved = other.snapshot();
    saved["pieces"][4]["id"] = "piece-7-7";

    EXPECT_THROW(session.resume(image, saved), ConfigError);
    EXPECT_EQ(session.current().seed, 31u);
    ASSERT_EQ(session.pieces().size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(session.pieces()[i].current_position, before[i]);
    }
    EXPECT_TRUE(session.pieces()[0].placed);
}

TEST(session, wronglyTypedSolvedFlagIsRejected) {
    NullFeedback feedback;
    PuzzleSession session(feedback);
    session.regenerate(make_test_image(400, 300), make_config(Difficulty::Easy, true), cv::Size(0, 0), 9);

    nlohmann::json saved = session.snapshot();
    cv::Point2d before = session.pieces()[1].current_position;
    saved["pieces"][1]["current"] = { 1.0, 2.0 };
    saved["solved"] = "yes";

    EXPECT_THROW(session.restore(saved), ConfigError);
    EXPECT_EQ(session.pieces()[1].current_position, before);
    EXPECT_FALSE(session.is_solved());

    saved["solved"] = false;
    saved["elapsed_ms"] = "long";
    EXPECT_THROW(session.restore(saved), ConfigError);
    EXPECT_EQ(session.pieces()[1].current_position, before);
}

TEST(session, saveFromAnotherSeedIsRejected) {
    NullFeedback feedback;
    cv::Mat image = make_test_image(400, 300);

    PuzzleSession session(feedback);
    session.regenerate(image, make_config(Difficulty::Medium, true), cv::Size(0, 0), 1);
    nlohmann::json saved = session.snapshot();

    // Flip the shared edge between piece-0-0 and piece-0-1 in the save
    for (auto& entry : saved["pieces"]) {
        if (entry["id"] == "piece-0-0") {
            entry["shape"]["right"] = entry["shape"]["right"] == "tab" ? "blank" : "tab";
        }
    }
    EXPECT_THROW(session.restore(saved), ConfigError);

    for (auto& entry : saved["pieces"]) {
        if (entry["id"] == "piece-0-0") {
            entry["shape"]["right"] = "knob";
        }
    }
    EXPECT_THROW(session.restore(saved), ConfigError);
}
