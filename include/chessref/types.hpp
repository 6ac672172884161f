#pragma once

/// @file types.hpp
/// Core enumerations, grid coordinates and algebraic notation.

#include <chessref/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace chessref {

// ── Coord ───────────────────────────────────────────────────────────────────
// Row-major grid index: row 0 = rank 8 (black back rank), row 7 = rank 1;
// col 0 = file 'a', col 7 = file 'h'.
inline constexpr int kBoardSize = 8;

struct Coord {
    int row = 0;
    int col = 0;

    [[nodiscard]] constexpr bool operator==(const Coord&) const noexcept = default;
};

[[nodiscard]] constexpr bool in_bounds(Coord c) noexcept {
    return c.row >= 0 && c.row < kBoardSize && c.col >= 0 && c.col < kBoardSize;
}

/// Parse "e2" (file case-insensitive) into grid indices.
[[nodiscard]] Result<Coord> algebraic_to_index(std::string_view square);

/// Lowercase algebraic name of grid indices, e.g. {6, 4} -> "e2".
[[nodiscard]] Result<std::string> index_to_algebraic(Coord c);

// ── Color ───────────────────────────────────────────────────────────────────
enum class Color : std::uint8_t { White = 0, Black = 1 };

[[nodiscard]] constexpr Color opposite(Color c) noexcept {
    return static_cast<Color>(static_cast<int>(c) ^ 1);
}

/// Row delta of a forward pawn step.
[[nodiscard]] constexpr int pawn_direction(Color c) noexcept {
    return c == Color::White ? -1 : 1;
}

/// Row a pawn of this color starts on.
[[nodiscard]] constexpr int pawn_start_row(Color c) noexcept {
    return c == Color::White ? 6 : 1;
}

[[nodiscard]] constexpr std::string_view to_string(Color c) noexcept {
    return c == Color::White ? "white" : "black";
}

// ── PieceType ───────────────────────────────────────────────────────────────
enum class PieceType : std::uint8_t {
    Pawn,
    Knight,
    Bishop,
    Rook,
    Queen,
    King,
};

[[nodiscard]] constexpr std::string_view to_string(PieceType pt) noexcept {
    switch (pt) {
            // clang-format off
        case PieceType::Pawn:   return "pawn";
        case PieceType::Knight: return "knight";
        case PieceType::Bishop: return "bishop";
        case PieceType::Rook:   return "rook";
        case PieceType::Queen:  return "queen";
        case PieceType::King:   return "king";
            // clang-format on
    }
    return "unknown";
}

/// Parse a promotion code (q, r, b, n; case-insensitive).
[[nodiscard]] Result<PieceType> parse_promotion(std::string_view code);

/// Lowercase promotion code for a promotable type ('q', 'r', 'b', 'n'), '?' otherwise.
[[nodiscard]] constexpr char promotion_char(PieceType pt) noexcept {
    switch (pt) {
            // clang-format off
        case PieceType::Queen:  return 'q';
        case PieceType::Rook:   return 'r';
        case PieceType::Bishop: return 'b';
        case PieceType::Knight: return 'n';
        default:                return '?';
            // clang-format on
    }
}

// ── GameStatus ──────────────────────────────────────────────────────────────
// Only one state exists under the MVP rule set; checks are kept for
// terminal states added later.
enum class GameStatus : std::uint8_t { InProgress = 0 };

[[nodiscard]] constexpr std::string_view to_string(GameStatus s) noexcept {
    switch (s) {
        case GameStatus::InProgress:
            return "in_progress";
    }
    return "unknown";
}

}  // namespace chessref
