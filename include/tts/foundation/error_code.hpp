#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the session core.

#include <cstdint>
#include <string_view>

namespace tts::foundation {

/// Error codes grouped by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of an
/// error can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,

    // Campaign / roster (0x0100 - 0x01FF)
    CampaignNotFound = 0x0100,
    CharacterNotFound = 0x0101,
    AmbiguousCharacter = 0x0102,
    DuplicateCharacter = 0x0103,
    CharacterAlreadyClaimed = 0x0104,
    CharacterNotClaimed = 0x0105,
    NotAPlayerCharacter = 0x0106,

    // Combat (0x0200 - 0x02FF)
    NoActiveCombat = 0x0200,
    EmptyTurnOrder = 0x0201,
    CombatantNotInTurnOrder = 0x0202,
    NotAnEnemy = 0x0203,
    CombatantAlreadyPresent = 0x0204,

    // Vitality (0x0300 - 0x03FF)
    DeathSaveNotApplicable = 0x0300,
    InvalidDeathSaveCount = 0x0301,
    CharacterIsDead = 0x0302,
    CharacterNotDying = 0x0303,
    InvalidHitPoints = 0x0304,

    // Persistence (0x0400 - 0x04FF)
    PersistenceFailed = 0x0400,
    AggregateCorrupted = 0x0401,

    // Notification (0x0500 - 0x05FF)
    PublishFailed = 0x0500,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Tool gateway (0x0700 - 0x07FF)
    UnknownTool = 0x0700,
    MissingArgument = 0x0701,
    ArgumentTypeMismatch = 0x0702,
    UnknownStateKey = 0x0703,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Caller-facing classification of a failure.
///
/// The tool gateway reports this kind to the external caller; the exact
/// ErrorCode is kept for logs and tests.
enum class ErrorKind : uint8_t {
    None,
    NotFound,
    InvalidState,
    ValidationError,
    PersistenceFailure,
    Internal
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Campaign";
        case 0x0200: return "Combat";
        case 0x0300: return "Vitality";
        case 0x0400: return "Persistence";
        case 0x0500: return "Notification";
        case 0x0600: return "Config";
        case 0x0700: return "Tool";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

/// Map an error code onto the caller-facing taxonomy.
constexpr ErrorKind errorKind(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorKind::None;

        case ErrorCode::NotFound:
        case ErrorCode::CampaignNotFound:
        case ErrorCode::CharacterNotFound:
        case ErrorCode::AmbiguousCharacter:
        case ErrorCode::ConfigKeyNotFound:
            return ErrorKind::NotFound;

        case ErrorCode::NoActiveCombat:
        case ErrorCode::EmptyTurnOrder:
        case ErrorCode::CombatantNotInTurnOrder:
        case ErrorCode::NotAnEnemy:
        case ErrorCode::CombatantAlreadyPresent:
        case ErrorCode::CharacterAlreadyClaimed:
        case ErrorCode::CharacterNotClaimed:
        case ErrorCode::NotAPlayerCharacter:
        case ErrorCode::DeathSaveNotApplicable:
        case ErrorCode::CharacterIsDead:
        case ErrorCode::CharacterNotDying:
            return ErrorKind::InvalidState;

        case ErrorCode::InvalidArgument:
        case ErrorCode::DuplicateCharacter:
        case ErrorCode::InvalidDeathSaveCount:
        case ErrorCode::InvalidHitPoints:
        case ErrorCode::ConfigTypeMismatch:
        case ErrorCode::UnknownTool:
        case ErrorCode::MissingArgument:
        case ErrorCode::ArgumentTypeMismatch:
        case ErrorCode::UnknownStateKey:
            return ErrorKind::ValidationError;

        case ErrorCode::PersistenceFailed:
        case ErrorCode::AggregateCorrupted:
            return ErrorKind::PersistenceFailure;

        default:
            return ErrorKind::Internal;
    }
}

/// Return the taxonomy name reported to tool callers.
constexpr std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidState: return "InvalidState";
        case ErrorKind::ValidationError: return "ValidationError";
        case ErrorKind::PersistenceFailure: return "PersistenceFailure";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

} // namespace tts::foundation
