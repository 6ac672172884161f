#pragma once

/// @file piece.hpp
/// Piece value object (color + type).

#include <chessref/types.hpp>

namespace chessref {

/// An immutable piece on the board (color + type).
struct Piece {
    Color color;
    PieceType type;

    [[nodiscard]] constexpr bool operator==(const Piece&) const noexcept = default;

    /// FEN-style character ('P','N','B','R','Q','K' for white, lowercase for black).
    [[nodiscard]] constexpr char symbol() const noexcept {
        // clang-format off
        constexpr char kChars[2][6] = {
            {'P', 'N', 'B', 'R', 'Q', 'K'},
            {'p', 'n', 'b', 'r', 'q', 'k'},
        };
        // clang-format on
        return kChars[static_cast<int>(color)][static_cast<int>(type)];
    }
};

}  // namespace chessref
