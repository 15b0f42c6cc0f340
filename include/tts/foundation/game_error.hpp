#pragma once

/// @file game_error.hpp
/// @brief GameError: what went wrong, which subsystem noticed, and the
///        taxonomy kind a tool caller sees.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "tts/foundation/error_code.hpp"

namespace tts::foundation {

/// Error returned through GameResult.
///
/// The optional context carries the offending input, e.g. the character
/// reference that failed to resolve or the CampaignId that has no record.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code) : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] std::string_view message() const noexcept { return message_; }
    [[nodiscard]] std::string_view subsystem() const noexcept { return errorSubsystem(code_); }
    [[nodiscard]] ErrorKind kind() const noexcept { return errorKind(code_); }

    /// "<Subsystem> <Kind>: <message>", for operator-facing output.
    [[nodiscard]] std::string describe() const {
        std::string text(subsystem());
        text += ' ';
        text += errorKindName(kind());
        text += ": ";
        text += message_;
        return text;
    }

    /// nullptr when there is no context or it holds another type.
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

}  // namespace tts::foundation
