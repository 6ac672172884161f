/// @file test_engine.cpp
/// Tests for engine.hpp: ordered validation, application, history, restart.

#include <chessref/engine.hpp>

#include <gtest/gtest.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace chessref;

namespace {

Coord sq(const char* name) {
    return algebraic_to_index(name).value();
}

// Plays a sequence of (from, to) moves that must all succeed.
void play(Engine& engine, const std::vector<std::pair<const char*, const char*>>& moves) {
    for (const auto& [from, to] : moves) {
        auto r = engine.apply_move(from, to);
        ASSERT_TRUE(r.ok()) << from << to << ": " << r.error().message;
    }
}

// Asserts that a rejected move leaves board, turn and history untouched.
Error expect_rejected(Engine& engine, std::string_view from, std::string_view to,
                      std::optional<std::string_view> promotion = std::nullopt) {
    const GameSnapshot before = engine.state();
    const std::vector<MoveRecord> history_before = engine.history();
    auto r = engine.apply_move(from, to, promotion);
    EXPECT_FALSE(r.ok()) << "accepted " << from << to;
    EXPECT_EQ(engine.state(), before);
    EXPECT_EQ(engine.history(), history_before);
    return r.ok() ? Error::make(ErrorCode::GameNotInProgress, "unexpected success") : r.error();
}

}  // namespace

// ── Construction / restart ──────────────────────────────────────────────────

TEST(Engine, StartsInInitialPosition) {
    Engine e;
    EXPECT_EQ(e.board(), Board::initial());
    EXPECT_EQ(e.current_turn(), Color::White);
    EXPECT_EQ(e.status(), GameStatus::InProgress);
    EXPECT_TRUE(e.history().empty());
}

TEST(Engine, RestartResets) {
    Engine e;
    play(e, {{"e2", "e4"}, {"e7", "e5"}, {"g1", "f3"}});
    e.restart();

    EXPECT_EQ(e.board(), Board::initial());
    EXPECT_EQ(e.board().piece_count(), 32);
    EXPECT_EQ(e.current_turn(), Color::White);
    EXPECT_EQ(e.status(), GameStatus::InProgress);
    EXPECT_TRUE(e.history().empty());
}

TEST(Engine, RestartIsIdempotent) {
    Engine e;
    e.restart();
    GameSnapshot once = e.state();
    e.restart();
    EXPECT_EQ(e.state(), once);
}

// ── Scenarios ───────────────────────────────────────────────────────────────

TEST(Engine, PawnDoublePushE4) {
    Engine e;
    auto r = e.apply_move("e2", "e4");
    ASSERT_TRUE(r.ok());

    const MoveRecord& m = r.value();
    EXPECT_EQ(m.move_number, 1);
    EXPECT_EQ(m.color, Color::White);
    EXPECT_EQ(m.from, "e2");
    EXPECT_EQ(m.to, "e4");
    EXPECT_FALSE(m.capture);
    EXPECT_FALSE(m.promotion.has_value());
    EXPECT_EQ(m.piece, Piece(Color::White, PieceType::Pawn));

    EXPECT_EQ(e.board().piece_at(sq("e4")), Piece(Color::White, PieceType::Pawn));
    EXPECT_TRUE(e.board().is_empty(sq("e2")));
    EXPECT_EQ(e.current_turn(), Color::Black);
    ASSERT_EQ(e.history().size(), 1u);
    EXPECT_EQ(e.history().front(), m);
}

TEST(Engine, PawnTooFarRejected) {
    Engine e;
    Error err = expect_rejected(e, "e2", "e5");
    EXPECT_EQ(err.code, ErrorCode::IllegalPieceMove);
    EXPECT_EQ(err.violation, MoveViolation::IllegalPawnMove);
}

TEST(Engine, PromotionDefaultsToQueen) {
    Board b;
    b.put_piece(sq("a7"), {Color::White, PieceType::Pawn});
    b.put_piece(sq("e1"), {Color::White, PieceType::King});
    b.put_piece(sq("e8"), {Color::Black, PieceType::King});
    Engine e(b, Color::White);

    auto r = e.apply_move("a7", "a8");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().promotion, PieceType::Queen);
    EXPECT_EQ(r.value().uci(), "a7a8q");
    EXPECT_EQ(r.value().piece, Piece(Color::White, PieceType::Pawn));
    EXPECT_EQ(e.board().piece_at(sq("a8")), Piece(Color::White, PieceType::Queen));
    EXPECT_TRUE(e.board().is_empty(sq("a7")));
}

TEST(Engine, PromotionToKnightCaseInsensitive) {
    Board b;
    b.put_piece(sq("h2"), {Color::Black, PieceType::Pawn});
    b.put_piece(sq("g1"), {Color::White, PieceType::Rook});
    Engine e(b, Color::Black);

    auto r = e.apply_move("h2", "g1", "N");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_TRUE(r.value().capture);
    EXPECT_EQ(r.value().promotion, PieceType::Knight);
    EXPECT_EQ(e.board().piece_at(sq("g1")), Piece(Color::Black, PieceType::Knight));
}

TEST(Engine, InvalidPromotionCodeRejectedBeforeMutation) {
    Board b;
    b.put_piece(sq("a7"), {Color::White, PieceType::Pawn});
    Engine e(b, Color::White);

    Error err = expect_rejected(e, "a7", "a8", "k");
    EXPECT_EQ(err.code, ErrorCode::InvalidPromotion);
    EXPECT_EQ(e.board().piece_at(sq("a7")), Piece(Color::White, PieceType::Pawn));
}

TEST(Engine, PromotionCodeOffLastRank) {
    Engine e;
    Error err = expect_rejected(e, "e2", "e4", "q");
    EXPECT_EQ(err.code, ErrorCode::PromotionNotAllowed);
}

TEST(Engine, PromotionCodeOnNonPawn) {
    Engine e;
    Error err = expect_rejected(e, "g1", "f3", "q");
    EXPECT_EQ(err.code, ErrorCode::PromotionNotAllowed);

    // A non-pawn's own pattern error is reported ahead of the promotion code.
    err = expect_rejected(e, "g1", "g3", "q");
    EXPECT_EQ(err.code, ErrorCode::IllegalPieceMove);
}

TEST(Engine, PromotionCodeIgnoredForNonPawnOnLastRank) {
    Board b;
    b.put_piece(sq("a1"), {Color::White, PieceType::Rook});
    b.put_piece(sq("h8"), {Color::Black, PieceType::Queen});
    Engine e(b, Color::White);

    auto r = e.apply_move("a1", "a8", "q");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_FALSE(r.value().promotion.has_value());
    EXPECT_EQ(e.board().piece_at(sq("a8")), Piece(Color::White, PieceType::Rook));

    r = e.apply_move("h8", "h1", "n");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_FALSE(r.value().promotion.has_value());
    EXPECT_EQ(e.board().piece_at(sq("h1")), Piece(Color::Black, PieceType::Queen));
}

TEST(Engine, EmptyPromotionCodeOffLastRank) {
    Engine e;
    Error err = expect_rejected(e, "e2", "e4", "");
    EXPECT_EQ(err.code, ErrorCode::PromotionNotAllowed);
}

TEST(Engine, EmptyPromotionCodeOnLastRankIsQueen) {
    Board b;
    b.put_piece(sq("c7"), {Color::White, PieceType::Pawn});
    Engine e(b, Color::White);

    auto r = e.apply_move("c7", "c8", "");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().promotion, PieceType::Queen);
    EXPECT_EQ(e.board().piece_at(sq("c8")), Piece(Color::White, PieceType::Queen));
}

TEST(Engine, BishopBlockedThenClear) {
    Engine e;
    Error err = expect_rejected(e, "f1", "c4");
    EXPECT_EQ(err.violation, MoveViolation::BlockedPath);

    play(e, {{"e2", "e4"}, {"e7", "e5"}});
    auto r = e.apply_move("f1", "c4");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(e.board().piece_at(sq("c4")), Piece(Color::White, PieceType::Bishop));
}

TEST(Engine, EmptySourceRegardlessOfDestination) {
    Engine e;
    Error err = expect_rejected(e, "e4", "e5");
    EXPECT_EQ(err.code, ErrorCode::EmptySource);
    EXPECT_EQ(err.message, "No piece at e4.");

    err = expect_rejected(e, "d5", "h8");
    EXPECT_EQ(err.code, ErrorCode::EmptySource);
}

TEST(Engine, Capture) {
    Engine e;
    play(e, {{"e2", "e4"}, {"d7", "d5"}});
    auto r = e.apply_move("e4", "d5");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_TRUE(r.value().capture);
    EXPECT_EQ(e.board().piece_count(), 31);
    EXPECT_EQ(e.board().piece_at(sq("d5")), Piece(Color::White, PieceType::Pawn));
}

// ── Check ordering ──────────────────────────────────────────────────────────

TEST(Engine, SameSquare) {
    Engine e;
    Error err = expect_rejected(e, "e2", "e2");
    EXPECT_EQ(err.code, ErrorCode::SameSquare);
    err = expect_rejected(e, "E2", "e2");
    EXPECT_EQ(err.code, ErrorCode::SameSquare);
    // Checked before parsing.
    err = expect_rejected(e, "z9", "z9");
    EXPECT_EQ(err.code, ErrorCode::SameSquare);
}

TEST(Engine, InvalidSquare) {
    Engine e;
    Error err = expect_rejected(e, "e9", "e4");
    EXPECT_EQ(err.code, ErrorCode::InvalidSquare);
    err = expect_rejected(e, "e2", "");
    EXPECT_EQ(err.code, ErrorCode::InvalidSquare);
    // Malformed destination wins over an empty source.
    err = expect_rejected(e, "e4", "x1");
    EXPECT_EQ(err.code, ErrorCode::InvalidSquare);
}

TEST(Engine, WrongTurn) {
    Engine e;
    Error err = expect_rejected(e, "e7", "e5");
    EXPECT_EQ(err.code, ErrorCode::WrongTurn);
    EXPECT_EQ(err.message, "It is white's turn.");

    play(e, {{"e2", "e4"}});
    err = expect_rejected(e, "d2", "d4");
    EXPECT_EQ(err.code, ErrorCode::WrongTurn);
    EXPECT_EQ(err.message, "It is black's turn.");
}

TEST(Engine, FriendlyCapture) {
    Engine e;
    Error err = expect_rejected(e, "a1", "a2");
    EXPECT_EQ(err.code, ErrorCode::FriendlyCapture);
    // Friendly capture is reported before the (also illegal) rook pattern.
    err = expect_rejected(e, "a1", "b2");
    EXPECT_EQ(err.code, ErrorCode::FriendlyCapture);
}

TEST(Engine, UppercaseInputRecordedLowercase) {
    Engine e;
    auto r = e.apply_move("G1", "F3");
    ASSERT_TRUE(r.ok()) << r.error().message;
    EXPECT_EQ(r.value().from, "g1");
    EXPECT_EQ(r.value().to, "f3");
}

// ── History / turn invariants ───────────────────────────────────────────────

TEST(Engine, TurnAlternatesAndMoveNumbers) {
    Engine e;
    const std::vector<std::pair<const char*, const char*>> moves = {
        {"e2", "e4"}, {"e7", "e5"}, {"g1", "f3"}, {"b8", "c6"}, {"f1", "b5"}, {"a7", "a6"},
    };
    const int expected_numbers[] = {1, 1, 2, 2, 3, 3};

    for (std::size_t i = 0; i < moves.size(); ++i) {
        EXPECT_EQ(e.current_turn(), i % 2 == 0 ? Color::White : Color::Black);
        auto r = e.apply_move(moves[i].first, moves[i].second);
        ASSERT_TRUE(r.ok()) << r.error().message;
        EXPECT_EQ(r.value().move_number, expected_numbers[i]);
        EXPECT_EQ(r.value().color, i % 2 == 0 ? Color::White : Color::Black);
    }
    EXPECT_EQ(e.current_turn(), Color::White);
    ASSERT_EQ(e.history().size(), moves.size());
    for (std::size_t i = 0; i < moves.size(); ++i) {
        EXPECT_EQ(e.history()[i].from, moves[i].first);
        EXPECT_EQ(e.history()[i].to, moves[i].second);
    }
}

TEST(Engine, RejectionsDoNotAdvanceMoveNumber) {
    Engine e;
    play(e, {{"e2", "e4"}});
    (void)expect_rejected(e, "e7", "e4");
    play(e, {{"e7", "e5"}, {"d2", "d4"}});
    EXPECT_EQ(e.history().back().move_number, 2);
}

// ── State projection ────────────────────────────────────────────────────────

TEST(Engine, StateIsSparse) {
    Engine e;
    GameSnapshot s = e.state();
    ASSERT_EQ(s.board.size(), 32u);
    EXPECT_EQ(s.board.front().square, "a8");
    EXPECT_EQ(s.board.front().piece, Piece(Color::Black, PieceType::Rook));
    EXPECT_EQ(s.board.back().square, "h1");
    EXPECT_EQ(s.board.back().piece, Piece(Color::White, PieceType::Rook));
    EXPECT_EQ(s.current_turn, Color::White);
    EXPECT_EQ(s.status, GameStatus::InProgress);
}

TEST(Engine, StateTracksMoves) {
    Engine e;
    play(e, {{"e2", "e4"}});
    GameSnapshot s = e.state();
    EXPECT_EQ(s.board.size(), 32u);
    EXPECT_EQ(s.current_turn, Color::Black);

    bool found_e4 = false;
    for (const auto& entry : s.board) {
        EXPECT_NE(entry.square, "e2");
        if (entry.square == "e4") {
            found_e4 = true;
            EXPECT_EQ(entry.piece, Piece(Color::White, PieceType::Pawn));
        }
    }
    EXPECT_TRUE(found_e4);
}
