/// @file engine.cpp
/// Engine implementation: ordered move validation, application, projections.

#include <chessref/engine.hpp>

#include <chessref/rules.hpp>

#include <cctype>
#include <utility>

namespace chessref {

namespace {

bool equals_ignore_case(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ── Constructors ────────────────────────────────────────────────────────────

Engine::Engine() : board_(Board::initial()) {}

Engine::Engine(Board board, Color side_to_move)
    : board_(std::move(board)), current_turn_(side_to_move) {}

void Engine::restart() {
    board_ = Board::initial();
    current_turn_ = Color::White;
    status_ = GameStatus::InProgress;
    history_.clear();
}

// ── Move application ────────────────────────────────────────────────────────

Result<MoveRecord> Engine::apply_move(std::string_view from, std::string_view to,
                                      std::optional<std::string_view> promotion) {
    if (status_ != GameStatus::InProgress) {
        return Error::make(ErrorCode::GameNotInProgress, "Game is not in progress.");
    }
    if (equals_ignore_case(from, to)) {
        return Error::make(ErrorCode::SameSquare, "from and to squares must be different.");
    }

    auto src = algebraic_to_index(from);
    if (!src) return src.error();
    auto dst = algebraic_to_index(to);
    if (!dst) return dst.error();

    const Coord fr = src.value();
    const Coord tc = dst.value();
    std::string from_name = index_to_algebraic(fr).value();
    std::string to_name = index_to_algebraic(tc).value();

    const std::optional<Piece> moving = board_.piece_at(fr);
    if (!moving) {
        return Error::make(ErrorCode::EmptySource, "No piece at " + from_name + ".");
    }
    if (moving->color != current_turn_) {
        return Error::make(ErrorCode::WrongTurn,
                           "It is " + std::string(to_string(current_turn_)) + "'s turn.");
    }

    const std::optional<Piece> target = board_.piece_at(tc);
    if (target && target->color == moving->color) {
        return Error::make(ErrorCode::FriendlyCapture, "Cannot capture your own piece.");
    }
    const bool capture = target.has_value();

    Status legal =
        rules::validate_piece_move(board_, *moving, fr, tc, capture, promotion.has_value());
    if (!legal) return legal.error();

    // Resolve promotion before touching the board. An empty code on the last
    // row means the default queen.
    std::optional<PieceType> promoted;
    if (moving->type == PieceType::Pawn && rules::is_last_row(tc.row)) {
        Result<PieceType> pt =
            promotion && !promotion->empty() ? parse_promotion(*promotion) : PieceType::Queen;
        if (!pt) return pt.error();
        promoted = pt.value();
    } else if (promotion && !rules::is_last_row(tc.row)) {
        return Error::make(ErrorCode::PromotionNotAllowed,
                           "Promotion is only allowed when pawn reaches last rank.");
    }

    board_.move_piece(fr, tc);
    if (promoted) {
        board_.put_piece(tc, {moving->color, *promoted});
    }

    MoveRecord record;
    record.move_number = static_cast<int>(history_.size() / 2) + 1;
    record.color = moving->color;
    record.from = std::move(from_name);
    record.to = std::move(to_name);
    record.capture = capture;
    record.promotion = promoted;
    record.piece = *moving;
    history_.push_back(record);

    current_turn_ = opposite(current_turn_);
    return record;
}

// ── Projections ─────────────────────────────────────────────────────────────

GameSnapshot Engine::state() const {
    GameSnapshot snap;
    snap.current_turn = current_turn_;
    snap.status = status_;
    for (int row = 0; row < kBoardSize; ++row) {
        for (int col = 0; col < kBoardSize; ++col) {
            const Coord c{row, col};
            if (auto p = board_.piece_at(c)) {
                snap.board.push_back({index_to_algebraic(c).value(), *p});
            }
        }
    }
    return snap;
}

}  // namespace chessref
