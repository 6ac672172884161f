/// @file board.cpp
/// Board implementation: initial position factory, counting, rendering.

#include <chessref/board.hpp>

namespace chessref {

Board Board::initial() noexcept {
    Board b;

    // Black pawns: rank 7 (row 1); white pawns: rank 2 (row 6)
    for (int col = 0; col < kBoardSize; ++col) {
        b.put_piece({1, col}, {Color::Black, PieceType::Pawn});
        b.put_piece({6, col}, {Color::White, PieceType::Pawn});
    }

    // Back ranks
    constexpr PieceType kBackRank[] = {
        PieceType::Rook, PieceType::Knight, PieceType::Bishop, PieceType::Queen,
        PieceType::King, PieceType::Bishop, PieceType::Knight, PieceType::Rook,
    };

    for (int col = 0; col < kBoardSize; ++col) {
        b.put_piece({0, col}, {Color::Black, kBackRank[col]});
        b.put_piece({7, col}, {Color::White, kBackRank[col]});
    }

    return b;
}

int Board::piece_count() const noexcept {
    int n = 0;
    for (const auto& row : cells_) {
        for (const auto& cell : row) {
            if (cell) ++n;
        }
    }
    return n;
}

std::string Board::to_ascii() const {
    std::string out;
    out.reserve(kBoardSize * (kBoardSize + 1));
    for (const auto& row : cells_) {
        for (const auto& cell : row) {
            out += cell ? cell->symbol() : '.';
        }
        out += '\n';
    }
    return out;
}

}  // namespace chessref
