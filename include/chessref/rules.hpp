#pragma once

/// @file rules.hpp
/// Per-piece movement legality under the MVP rule set.
///
/// No check, castling or en-passant handling. Callers have already resolved
/// turn order and rejected captures of their own pieces.

#include <chessref/board.hpp>
#include <chessref/result.hpp>

namespace chessref::rules {

/// Whether a pawn landing on `row` promotes (row 0 or row 7).
[[nodiscard]] constexpr bool is_last_row(int row) noexcept {
    return row == 0 || row == kBoardSize - 1;
}

/// Every cell strictly between `from` and `to` must be empty.
/// The two coords must lie on one rank, file or diagonal.
[[nodiscard]] Status require_clear_path(const Board& board, Coord from, Coord to);

/// Pawn pushes, double pushes from the start row and diagonal captures.
/// A requested promotion is rejected first unless `to` is on the last row.
[[nodiscard]] Status validate_pawn_move(const Board& board, Piece pawn, Coord from, Coord to,
                                        bool capture, bool promotion_requested);

/// Dispatch on `piece.type` and check its movement pattern (and path for sliders).
[[nodiscard]] Status validate_piece_move(const Board& board, Piece piece, Coord from, Coord to,
                                         bool capture, bool promotion_requested);

}  // namespace chessref::rules
