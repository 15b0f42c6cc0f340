#pragma once

/// @file game_result.hpp
/// @brief GameResult<T>: a value or a GameError, returned by every fallible
///        session operation.

#include <utility>
#include <variant>

#include "tts/foundation/game_error.hpp"

namespace tts::foundation {

/// Holds either the value produced by an operation or the GameError that
/// stopped it. Mutations never throw across a public boundary; a failed
/// mutation leaves the caller's campaign untouched and reports here.
///
/// Example:
/// @code
///   GameResult<void> recordFailure(Character& c, int32_t count) {
///       if (count < 0) {
///           return GameResult<void>::err(
///               GameError(ErrorCode::InvalidDeathSaveCount, "negative count"));
///       }
///       ...
///       return GameResult<void>::ok();
///   }
/// @endcode
template <typename T>
class GameResult {
public:
    static GameResult ok(T value) { return GameResult(std::move(value)); }
    static GameResult err(GameError error) { return GameResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool hasError() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return hasValue(); }

    /// Undefined behavior when hasError().
    [[nodiscard]] const T& value() const& { return std::get<0>(data_); }
    [[nodiscard]] T& value() & { return std::get<0>(data_); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(data_)); }

    /// Undefined behavior when hasValue().
    [[nodiscard]] const GameError& error() const& { return std::get<1>(data_); }

    [[nodiscard]] T valueOr(T fallback) const& {
        return hasValue() ? value() : std::move(fallback);
    }

private:
    explicit GameResult(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    explicit GameResult(GameError error) : data_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, GameError> data_;
};

/// Outcome of an operation with nothing to return beyond success.
template <>
class GameResult<void> {
public:
    static GameResult ok() { return GameResult(); }
    static GameResult err(GameError error) { return GameResult(std::move(error)); }

    [[nodiscard]] bool hasValue() const noexcept { return !failed_; }
    [[nodiscard]] bool hasError() const noexcept { return failed_; }
    explicit operator bool() const noexcept { return !failed_; }

    [[nodiscard]] const GameError& error() const& { return error_; }

private:
    GameResult() = default;
    explicit GameResult(GameError error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    GameError error_;
};

}  // namespace tts::foundation
