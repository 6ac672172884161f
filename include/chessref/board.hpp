#pragma once

/// @file board.hpp
/// 8x8 mailbox board of optional pieces.

#include <chessref/piece.hpp>
#include <chessref/types.hpp>

#include <array>
#include <optional>
#include <string>

namespace chessref {

/// Mailbox board representation.
///
/// Each of the 64 cells holds at most one piece. Indexed by Coord
/// (row 0 = rank 8, col 0 = file 'a'); callers must pass in-bounds coords.
class Board {
public:
    Board() noexcept { clear(); }

    // ── Piece placement ─────────────────────────────────────────────────

    /// Place a piece on the board, replacing whatever was there.
    void put_piece(Coord c, Piece p) noexcept { cells_[c.row][c.col] = p; }

    /// Remove whatever occupies a cell.
    void remove_piece(Coord c) noexcept { cells_[c.row][c.col].reset(); }

    /// Move the piece on `from` to `to`, overwriting any piece on `to`.
    void move_piece(Coord from, Coord to) noexcept {
        cells_[to.row][to.col] = cells_[from.row][from.col];
        cells_[from.row][from.col].reset();
    }

    // ── Queries ─────────────────────────────────────────────────────────

    /// Piece at a given cell (std::nullopt if empty).
    [[nodiscard]] std::optional<Piece> piece_at(Coord c) const noexcept {
        return cells_[c.row][c.col];
    }

    /// Whether a cell is empty.
    [[nodiscard]] bool is_empty(Coord c) const noexcept { return !cells_[c.row][c.col]; }

    /// Number of occupied cells.
    [[nodiscard]] int piece_count() const noexcept;

    // ── Bulk operations ─────────────────────────────────────────────────

    void clear() noexcept {
        for (auto& row : cells_) {
            for (auto& cell : row) {
                cell.reset();
            }
        }
    }

    [[nodiscard]] bool operator==(const Board&) const = default;

    /// Eight lines of piece symbols, rank 8 first, '.' for empty cells.
    [[nodiscard]] std::string to_ascii() const;

    // ── Factory ─────────────────────────────────────────────────────────

    /// Standard starting position.
    [[nodiscard]] static Board initial() noexcept;

private:
    std::array<std::array<std::optional<Piece>, kBoardSize>, kBoardSize> cells_{};
};

}  // namespace chessref
