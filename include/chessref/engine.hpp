#pragma once

/// @file engine.hpp
/// Move engine: the authoritative state of a single game.
///
/// Owns the board, side to move, game status and the move log. Not
/// thread-safe; see SynchronizedEngine for shared use.

#include <chessref/board.hpp>
#include <chessref/move.hpp>
#include <chessref/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chessref {

// ── State projection ────────────────────────────────────────────────────────

/// One occupied square in the sparse board listing.
struct BoardEntry {
    std::string square;  ///< Lowercase algebraic.
    Piece piece;

    [[nodiscard]] bool operator==(const BoardEntry&) const = default;
};

/// Read-only view of the game returned by Engine::state().
struct GameSnapshot {
    std::vector<BoardEntry> board;  ///< Occupied squares, a8..h8 down to a1..h1.
    Color current_turn = Color::White;
    GameStatus status = GameStatus::InProgress;

    [[nodiscard]] bool operator==(const GameSnapshot&) const = default;
};

// ── Engine ──────────────────────────────────────────────────────────────────

class Engine {
   public:
    /// Standard starting position, white to move.
    Engine();

    /// Arbitrary position with an empty log.
    Engine(Board board, Color side_to_move);

    /// Validate and apply a half-move. On failure nothing is changed.
    ///
    /// Squares are algebraic and case-insensitive; `promotion` is one of
    /// q, r, b, n (default queen when a pawn reaches the last rank).
    [[nodiscard]] Result<MoveRecord> apply_move(
        std::string_view from, std::string_view to,
        std::optional<std::string_view> promotion = std::nullopt);

    /// Reset to the starting position, white to move, empty log.
    void restart();

    [[nodiscard]] GameSnapshot state() const;
    [[nodiscard]] const std::vector<MoveRecord>& history() const noexcept { return history_; }

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const Board& board() const noexcept { return board_; }
    [[nodiscard]] Color current_turn() const noexcept { return current_turn_; }
    [[nodiscard]] GameStatus status() const noexcept { return status_; }

   private:
    Board board_;
    Color current_turn_ = Color::White;
    GameStatus status_ = GameStatus::InProgress;
    std::vector<MoveRecord> history_;
};

}  // namespace chessref
