/// @file rules.cpp
/// Movement pattern checks for each piece type.

#include <chessref/rules.hpp>

#include <algorithm>
#include <cstdlib>

namespace chessref::rules {

namespace {

// ── Helpers ─────────────────────────────────────────────────────────────────

constexpr int sign(int v) noexcept {
    return (v > 0) - (v < 0);
}

Error illegal_pattern(PieceType pt) {
    return Error::piece_move(MoveViolation::IllegalPattern,
                             "Illegal " + std::string(to_string(pt)) + " move.");
}

bool is_diagonal(int dr, int dc) noexcept {
    return dr != 0 && std::abs(dr) == std::abs(dc);
}

bool is_straight(int dr, int dc) noexcept {
    return (dr == 0) != (dc == 0);
}

}  // namespace

// ── Path clearance ──────────────────────────────────────────────────────────

Status require_clear_path(const Board& board, Coord from, Coord to) {
    const int step_r = sign(to.row - from.row);
    const int step_c = sign(to.col - from.col);

    Coord c{from.row + step_r, from.col + step_c};
    while (c != to) {
        if (!board.is_empty(c)) {
            return Error::piece_move(MoveViolation::BlockedPath, "Path is blocked.");
        }
        c.row += step_r;
        c.col += step_c;
    }
    return Status::success();
}

// ── Pawns ───────────────────────────────────────────────────────────────────

Status validate_pawn_move(const Board& board, Piece pawn, Coord from, Coord to, bool capture,
                          bool promotion_requested) {
    const int dr = to.row - from.row;
    const int dc = to.col - from.col;
    const int direction = pawn_direction(pawn.color);

    if (promotion_requested && !is_last_row(to.row)) {
        return Error::make(ErrorCode::PromotionNotAllowed,
                           "Promotion is only allowed when pawn reaches last rank.");
    }

    // Captures: one step diagonally forward
    if (capture) {
        if (dr != direction || std::abs(dc) != 1) {
            return Error::piece_move(MoveViolation::IllegalPawnCapture, "Illegal pawn capture.");
        }
        return Status::success();
    }

    if (dc != 0) {
        return Error::piece_move(MoveViolation::IllegalPawnMove,
                                 "Illegal pawn move (pawns move straight unless capturing).");
    }

    if (dr == direction) {
        if (!board.is_empty(to)) {
            return Error::piece_move(MoveViolation::PawnBlocked, "Pawn move blocked.");
        }
        return Status::success();
    }

    // Double push from the start row; both cells ahead must be empty
    if (from.row == pawn_start_row(pawn.color) && dr == 2 * direction) {
        const Coord mid{from.row + direction, from.col};
        if (!board.is_empty(mid) || !board.is_empty(to)) {
            return Error::piece_move(MoveViolation::PawnBlocked, "Pawn move blocked.");
        }
        return Status::success();
    }

    return Error::piece_move(MoveViolation::IllegalPawnMove, "Illegal pawn move.");
}

// ── Dispatch ────────────────────────────────────────────────────────────────

Status validate_piece_move(const Board& board, Piece piece, Coord from, Coord to, bool capture,
                           bool promotion_requested) {
    const int dr = to.row - from.row;
    const int dc = to.col - from.col;
    const int adr = std::abs(dr);
    const int adc = std::abs(dc);

    switch (piece.type) {
        case PieceType::Pawn:
            return validate_pawn_move(board, piece, from, to, capture, promotion_requested);

        case PieceType::Knight:
            if (!((adr == 1 && adc == 2) || (adr == 2 && adc == 1))) {
                return illegal_pattern(piece.type);
            }
            return Status::success();

        case PieceType::Bishop:
            if (!is_diagonal(dr, dc)) return illegal_pattern(piece.type);
            return require_clear_path(board, from, to);

        case PieceType::Rook:
            if (!is_straight(dr, dc)) return illegal_pattern(piece.type);
            return require_clear_path(board, from, to);

        case PieceType::Queen:
            if (!is_diagonal(dr, dc) && !is_straight(dr, dc)) return illegal_pattern(piece.type);
            return require_clear_path(board, from, to);

        case PieceType::King:
            if (std::max(adr, adc) != 1) return illegal_pattern(piece.type);
            return Status::success();
    }
    return illegal_pattern(piece.type);
}

}  // namespace chessref::rules
