#pragma once

/// @file result.hpp
/// Typed failure taxonomy and the Result / Status return types.
///
/// Rejected operations are reported as values rather than thrown, so every
/// caller has to look at the failure path explicitly.

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace chessref {

// ── ErrorCode ───────────────────────────────────────────────────────────────
enum class ErrorCode : std::uint8_t {
    InvalidSquare,
    IndexOutOfBounds,
    SameSquare,
    EmptySource,
    WrongTurn,
    FriendlyCapture,
    IllegalPieceMove,
    InvalidPromotion,
    PromotionNotAllowed,
    GameNotInProgress,
};

/// Sub-reason attached to ErrorCode::IllegalPieceMove.
enum class MoveViolation : std::uint8_t {
    None = 0,
    IllegalPattern,
    BlockedPath,
    IllegalPawnMove,
    IllegalPawnCapture,
    PawnBlocked,
};

/// snake_case name of an error code, e.g. "wrong_turn".
[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
            // clang-format off
        case ErrorCode::InvalidSquare:       return "invalid_square";
        case ErrorCode::IndexOutOfBounds:    return "index_out_of_bounds";
        case ErrorCode::SameSquare:          return "same_square";
        case ErrorCode::EmptySource:         return "empty_source";
        case ErrorCode::WrongTurn:           return "wrong_turn";
        case ErrorCode::FriendlyCapture:     return "friendly_capture";
        case ErrorCode::IllegalPieceMove:    return "illegal_piece_move";
        case ErrorCode::InvalidPromotion:    return "invalid_promotion";
        case ErrorCode::PromotionNotAllowed: return "promotion_not_allowed";
        case ErrorCode::GameNotInProgress:   return "game_not_in_progress";
            // clang-format on
    }
    return "unknown";
}

[[nodiscard]] constexpr std::string_view to_string(MoveViolation v) noexcept {
    switch (v) {
            // clang-format off
        case MoveViolation::None:               return "none";
        case MoveViolation::IllegalPattern:     return "illegal_pattern";
        case MoveViolation::BlockedPath:        return "blocked_path";
        case MoveViolation::IllegalPawnMove:    return "illegal_pawn_move";
        case MoveViolation::IllegalPawnCapture: return "illegal_pawn_capture";
        case MoveViolation::PawnBlocked:        return "pawn_blocked";
            // clang-format on
    }
    return "unknown";
}

// ── Error ───────────────────────────────────────────────────────────────────

/// A rejected operation: kind, optional piece-move sub-reason, readable text.
struct Error {
    ErrorCode code;
    MoveViolation violation = MoveViolation::None;
    std::string message;

    [[nodiscard]] bool operator==(const Error&) const = default;

    [[nodiscard]] static Error make(ErrorCode code, std::string message) {
        return {code, MoveViolation::None, std::move(message)};
    }

    [[nodiscard]] static Error piece_move(MoveViolation violation, std::string message) {
        return {ErrorCode::IllegalPieceMove, violation, std::move(message)};
    }
};

// ── Result ──────────────────────────────────────────────────────────────────

/// Either a value of type T or an Error.
template <typename T>
class Result {
   public:
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    /// The held value. Throws std::logic_error if this holds an error.
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
        return std::get<0>(data_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::logic_error("Result::value() on error: " + error().message);
        return std::get<0>(std::move(data_));
    }

    /// The held error. Throws std::logic_error if this holds a value.
    [[nodiscard]] const Error& error() const {
        if (ok()) throw std::logic_error("Result::error() on success");
        return std::get<1>(data_);
    }

   private:
    std::variant<T, Error> data_;
};

/// Success or an Error, for checks that produce no value.
class Status {
   public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    [[nodiscard]] static Status success() { return {}; }

    [[nodiscard]] bool ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    /// The held error. Throws std::logic_error on success.
    [[nodiscard]] const Error& error() const {
        if (!error_) throw std::logic_error("Status::error() on success");
        return *error_;
    }

   private:
    std::optional<Error> error_;
};

}  // namespace chessref
