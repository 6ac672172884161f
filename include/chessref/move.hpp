#pragma once

/// @file move.hpp
/// Move history record.

#include <chessref/piece.hpp>
#include <chessref/types.hpp>

#include <optional>
#include <string>

namespace chessref {

/// One accepted half-move, as appended to the game log.
struct MoveRecord {
    int move_number = 1;  ///< Full-move number: 1, 1, 2, 2, 3, ...
    Color color = Color::White;
    std::string from;  ///< Lowercase algebraic, e.g. "e2".
    std::string to;
    bool capture = false;
    std::optional<PieceType> promotion;  ///< Queen, Rook, Bishop or Knight when promoted.
    Piece piece{Color::White, PieceType::Pawn};  ///< Moved piece before promotion.

    [[nodiscard]] bool operator==(const MoveRecord&) const = default;

    /// UCI long-algebraic notation, e.g. "e2e4", "e7e8q".
    [[nodiscard]] std::string uci() const {
        std::string s = from + to;
        if (promotion) s += promotion_char(*promotion);
        return s;
    }
};

}  // namespace chessref
