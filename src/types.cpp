/// @file types.cpp
/// Algebraic notation and promotion code parsing.

#include <chessref/types.hpp>

#include <cctype>

namespace chessref {

Result<Coord> algebraic_to_index(std::string_view square) {
    if (square.size() != 2) {
        return Error::make(ErrorCode::InvalidSquare, "Square must be in algebraic form like 'e2'.");
    }
    const char file = static_cast<char>(std::tolower(static_cast<unsigned char>(square[0])));
    const char rank = square[1];

    if (file < 'a' || file > 'h') {
        return Error::make(ErrorCode::InvalidSquare, "File must be between a and h.");
    }
    if (rank < '1' || rank > '8') {
        return Error::make(ErrorCode::InvalidSquare, "Rank must be between 1 and 8.");
    }
    return Coord{kBoardSize - (rank - '0'), file - 'a'};
}

Result<std::string> index_to_algebraic(Coord c) {
    if (!in_bounds(c)) {
        return Error::make(ErrorCode::IndexOutOfBounds, "Index out of bounds.");
    }
    return std::string{static_cast<char>('a' + c.col), static_cast<char>('0' + kBoardSize - c.row)};
}

Result<PieceType> parse_promotion(std::string_view code) {
    if (code.size() == 1) {
        switch (std::tolower(static_cast<unsigned char>(code[0]))) {
            case 'q':
                return PieceType::Queen;
            case 'r':
                return PieceType::Rook;
            case 'b':
                return PieceType::Bishop;
            case 'n':
                return PieceType::Knight;
            default:
                break;
        }
    }
    return Error::make(ErrorCode::InvalidPromotion, "Invalid promotion piece. Use one of: q, r, b, n.");
}

}  // namespace chessref
